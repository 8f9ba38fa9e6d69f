// tests/test_layer3_bmap/bmap_test_support.cpp
#include "bmap_test_support.h"

#include <algorithm>
#include <cstring>

#include <fmt/format.h>

namespace bmapcopy::tests::bmap_support
{

std::string make_image(uint64_t size, uint8_t seed)
{
    std::string out(static_cast<size_t>(size), '\0');
    uint32_t x = 2463534242u + seed;
    for (auto &c : out)
    {
        // xorshift32; never yields an all-zero block
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        c = static_cast<char>((x & 0xff) | 1);
    }
    return out;
}

namespace
{
std::string_view range_bytes(std::string_view image, uint64_t block_size, uint64_t first,
                             uint64_t last)
{
    const uint64_t begin = std::min<uint64_t>(first * block_size, image.size());
    const uint64_t end = std::min<uint64_t>((last + 1) * block_size, image.size());
    return image.substr(static_cast<size_t>(begin), static_cast<size_t>(end - begin));
}

/** Digest of `bytes` for a known checksum type; empty for any other type. */
std::string digest_hex(const std::string &type, std::string_view bytes)
{
    if (type == "sha256")
        return bmapcopy::crypto::sha256_hex(bytes.data(), bytes.size());
    if (type == "sha1")
        return bmapcopy::crypto::sha1_hex(bytes.data(), bytes.size());
    return {};
}
} // namespace

std::string range_sha256(std::string_view image, uint64_t block_size, uint64_t first,
                         uint64_t last)
{
    return digest_hex("sha256", range_bytes(image, block_size, first, last));
}

std::string range_sha1(std::string_view image, uint64_t block_size, uint64_t first,
                       uint64_t last)
{
    return digest_hex("sha1", range_bytes(image, block_size, first, last));
}

std::string build_bmap_xml(const BmapLayout &layout, std::string_view image)
{
    const unsigned major = static_cast<unsigned>(std::stoul(layout.version));
    // 1.x documents always carry SHA-1.
    const std::string type = major >= 2 ? layout.checksum_type : std::string("sha1");
    const uint64_t blocks = layout.blocks_count.value_or(
        bmapcopy::bmap::blocks_for_bytes(layout.image_size, layout.block_size));
    uint64_t mapped = 0;
    for (const auto &[first, last] : layout.ranges)
        mapped += last - first + 1;
    mapped = layout.mapped_count.value_or(mapped);

    const std::string zeros(type == "sha256" ? 64 : 40, '0');
    std::string xml = fmt::format("<?xml version=\"1.0\" ?>\n"
                                  "<bmap version=\"{}\">\n"
                                  "    <ImageSize> {} </ImageSize>\n"
                                  "    <BlockSize> {} </BlockSize>\n"
                                  "    <BlocksCount> {} </BlocksCount>\n"
                                  "    <MappedBlocksCount> {} </MappedBlocksCount>\n",
                                  layout.version, layout.image_size, layout.block_size, blocks, mapped);
    if (major >= 2)
        xml += fmt::format("    <ChecksumType> {} </ChecksumType>\n", layout.checksum_type);
    if (layout.with_document_checksum)
    {
        const char *element = major >= 2 ? "BmapFileChecksum" : "BmapFileSHA1";
        xml += fmt::format("    <{0}> {1} </{0}>\n", element, zeros);
    }
    xml += "    <BlockMap>\n";
    const char *attr = major >= 2 ? "chksum" : "sha1";
    for (size_t i = 0; i < layout.ranges.size(); ++i)
    {
        const auto [first, last] = layout.ranges[i];
        const std::string text =
            first == last ? fmt::format("{}", first) : fmt::format("{}-{}", first, last);
        if (!layout.with_range_checksums)
        {
            xml += fmt::format("        <Range> {} </Range>\n", text);
            continue;
        }
        std::string sum;
        if (i < layout.range_checksums.size())
            sum = layout.range_checksums[i];
        else
            sum = digest_hex(type, range_bytes(image, layout.block_size, first, last));
        if (sum.empty())
            sum = std::string(40, 'a');
        xml += fmt::format("        <Range {}=\"{}\"> {} </Range>\n", attr, sum, text);
    }
    xml += "    </BlockMap>\n</bmap>\n";

    // Versions before 1.3 have no document checksum; the placeholder stays as written.
    const bool self_checksum = major >= 2 || std::stoul(layout.version.substr(2)) >= 3;
    const std::string digest = digest_hex(type, xml);
    if (layout.with_document_checksum && self_checksum && !digest.empty())
    {
        const auto pos = xml.find(zeros);
        xml.replace(pos, zeros.size(), digest);
    }
    return xml;
}

size_t MemoryImageSource::read_at(uint64_t offset, void *buf, size_t len)
{
    if (offset >= m_data.size())
        return 0;
    const size_t n = std::min<size_t>(len, m_data.size() - static_cast<size_t>(offset));
    std::memcpy(buf, m_data.data() + offset, n);
    return n;
}

void MemoryDestination::write_at(uint64_t offset, const void *data, size_t len)
{
    if (m_data.size() < offset + len)
        m_data.resize(static_cast<size_t>(offset + len), '\0');
    std::memcpy(m_data.data() + offset, data, len);
    ++writes;
}

} // namespace bmapcopy::tests::bmap_support
