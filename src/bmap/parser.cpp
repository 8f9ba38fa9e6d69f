/**
 * @file parser.cpp
 * @brief Block-map parsing on top of rapidxml.
 *
 * rapidxml parses in place, so the document is copied into a mutable buffer first.
 * Text pointers of that buffer keep the byte offsets of the original document, which
 * is what lets the self-checksum step zero exactly the checksum element's text.
 */
#include "bmc_service.hpp"
#include "bmap/errors.hpp"
#include "bmap/parser.hpp"

#include <rapidxml.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>

namespace bmapcopy::bmap
{

namespace
{

using XmlNode = rapidxml::xml_node<>;
using bmapcopy::format_tools::parse_u64;
using bmapcopy::format_tools::trim_whitespace;

[[noreturn]] void format_error(ErrorKind kind, std::string message, const std::string &origin)
{
    ErrorInfo info;
    info.kind = kind;
    info.message = std::move(message);
    info.path = origin;
    throw_error(std::move(info));
}

std::string_view node_text(const XmlNode *node) noexcept
{
    return trim_whitespace(std::string_view(node->value(), node->value_size()));
}

size_t count_children(const XmlNode *parent, const char *name)
{
    size_t n = 0;
    for (const XmlNode *c = parent->first_node(name); c != nullptr; c = c->next_sibling(name))
    {
        ++n;
    }
    return n;
}

uint64_t required_u64(const XmlNode *root, const char *name, const std::string &origin)
{
    const XmlNode *node = root->first_node(name);
    if (node == nullptr)
    {
        format_error(ErrorKind::Format,
                     fmt::format("the bmap file '{}' has no '{}' element", origin, name), origin);
    }
    uint64_t value = 0;
    if (!parse_u64(node_text(node), value))
    {
        format_error(ErrorKind::Format,
                     fmt::format("the '{}' element of bmap file '{}' is not a number: '{}'", name,
                                 origin, node_text(node)),
                     origin);
    }
    return value;
}

void parse_version(const XmlNode *root, BmapMetadata &md, const std::string &origin)
{
    const auto *attr = root->first_attribute("version");
    if (attr == nullptr)
    {
        format_error(ErrorKind::Format,
                     fmt::format("the bmap file '{}' has no version attribute", origin), origin);
    }
    const std::string_view text = trim_whitespace(std::string_view(attr->value(), attr->value_size()));
    const auto dot = text.find('.');
    uint64_t major = 0;
    uint64_t minor = 0;
    if (dot == std::string_view::npos || !parse_u64(text.substr(0, dot), major) ||
        !parse_u64(text.substr(dot + 1), minor) || major == 0)
    {
        format_error(ErrorKind::Format,
                     fmt::format("invalid bmap format version '{}' in '{}'", text, origin), origin);
    }
    if (major > SUPPORTED_MAJOR_VERSION)
    {
        format_error(ErrorKind::UnsupportedVersion,
                     fmt::format("only bmap format version up to {} is supported, version {} is "
                                 "not supported",
                                 SUPPORTED_MAJOR_VERSION, major),
                     origin);
    }
    md.version_major = static_cast<unsigned>(major);
    md.version_minor = static_cast<unsigned>(minor);
}

ChecksumType parse_checksum_type(const XmlNode *root, const BmapMetadata &md,
                                 const std::string &origin)
{
    if (md.version_major < 2)
    {
        return ChecksumType::Sha1;
    }
    const XmlNode *node = root->first_node("ChecksumType");
    if (node == nullptr)
    {
        format_error(ErrorKind::Format,
                     fmt::format("the bmap file '{}' has no 'ChecksumType' element", origin),
                     origin);
    }
    const std::string type = bmapcopy::format_tools::to_lower_ascii(node_text(node));
    if (type == "sha256")
        return ChecksumType::Sha256;
    if (type == "sha1")
        return ChecksumType::Sha1;
    format_error(ErrorKind::Format,
                 fmt::format("unsupported checksum type '{}' in bmap file '{}'", type, origin),
                 origin);
}

bool has_self_checksum(const BmapMetadata &md) noexcept
{
    return md.version_major > 1 || (md.version_major == 1 && md.version_minor >= 3);
}

/**
 * Recomputes the document checksum with the digest text replaced by zeros and
 * compares it with the declared one.
 */
void verify_self_checksum(std::string_view original, const char *buffer, const XmlNode *root,
                          BmapMetadata &md, const std::string &origin)
{
    const char *element = md.version_major >= 2 ? "BmapFileChecksum" : "BmapFileSHA1";
    const size_t count = count_children(root, element);
    if (count != 1)
    {
        format_error(ErrorKind::Format,
                     fmt::format("the bmap file '{}' must have exactly one '{}' element, found {}",
                                 origin, element, count),
                     origin);
    }
    const XmlNode *node = root->first_node(element);
    const std::string_view digest = node_text(node);
    md.document_checksum = std::string(digest);

    const bool sha1 = md.checksum_type == ChecksumType::Sha1;
    const size_t hex_chars =
        sha1 ? bmapcopy::crypto::SHA1_HEX_CHARS : bmapcopy::crypto::SHA256_HEX_CHARS;
    if (digest.size() != hex_chars)
    {
        format_error(ErrorKind::Format,
                     fmt::format("malformed checksum '{}' in bmap file '{}'", digest, origin),
                     origin);
    }

    // Locate the digest in the original bytes: same offset as the value in the buffer,
    // after any leading whitespace.
    size_t pos = static_cast<size_t>(node->value() - buffer);
    while (pos < original.size() &&
           std::string_view(" \t\r\n").find(original[pos]) != std::string_view::npos)
    {
        ++pos;
    }
    if (original.substr(pos, digest.size()) != digest)
    {
        format_error(ErrorKind::Format,
                     fmt::format("cannot locate the checksum text in bmap file '{}'", origin),
                     origin);
    }

    std::string zeroed(original);
    zeroed.replace(pos, digest.size(), digest.size(), '0');
    const std::string calculated = sha1 ? bmapcopy::crypto::sha1_hex(zeroed.data(), zeroed.size())
                                        : bmapcopy::crypto::sha256_hex(zeroed.data(), zeroed.size());
    if (calculated.empty())
    {
        format_error(ErrorKind::Format,
                     fmt::format("cannot compute the checksum of bmap file '{}'", origin), origin);
    }
    if (!bmapcopy::crypto::hex_digest_equals(calculated, digest))
    {
        ErrorInfo info;
        info.kind = ErrorKind::ChecksumMismatch;
        info.message = fmt::format("checksum mismatch for bmap file '{}': calculated {}, should "
                                   "be {}",
                                   origin, calculated, digest);
        info.path = origin;
        throw_error(std::move(info));
    }
}

void parse_ranges(const XmlNode *root, BmapDocument &doc)
{
    const BmapMetadata &md = doc.metadata;
    const std::string &origin = doc.origin;
    const XmlNode *map = root->first_node("BlockMap");
    if (map == nullptr)
    {
        format_error(ErrorKind::Format,
                     fmt::format("the bmap file '{}' has no 'BlockMap' element", origin), origin);
    }
    const char *checksum_attr = md.version_major >= 2 ? "chksum" : "sha1";
    const size_t hex_chars = md.checksum_type == ChecksumType::Sha1
                                 ? bmapcopy::crypto::SHA1_HEX_CHARS
                                 : bmapcopy::crypto::SHA256_HEX_CHARS;
    const uint64_t blocks = md.blocks_count().value_or(0);

    for (const XmlNode *node = map->first_node("Range"); node != nullptr;
         node = node->next_sibling("Range"))
    {
        Range range;
        const std::string_view text = node_text(node);
        if (!parse_range_text(text, range.first, range.last))
        {
            ErrorInfo info;
            info.kind = ErrorKind::InvalidRange;
            info.message = fmt::format("invalid block range '{}' in bmap file '{}'", text, origin);
            info.path = origin;
            throw_error(std::move(info));
        }
        if (!doc.ranges.empty() && range.first <= doc.ranges.back().last)
        {
            ErrorInfo info;
            info.kind = ErrorKind::InvalidRange;
            info.message = fmt::format("block range {}-{} in bmap file '{}' overlaps or precedes "
                                       "range {}-{}",
                                       range.first, range.last, origin, doc.ranges.back().first,
                                       doc.ranges.back().last);
            info.path = origin;
            info.first_block = range.first;
            info.last_block = range.last;
            throw_error(std::move(info));
        }
        if (range.last >= blocks)
        {
            ErrorInfo info;
            info.kind = ErrorKind::InvalidRange;
            info.message = fmt::format("block range {}-{} in bmap file '{}' is beyond the last "
                                       "block {}",
                                       range.first, range.last, origin,
                                       blocks == 0 ? 0 : blocks - 1);
            info.path = origin;
            info.first_block = range.first;
            info.last_block = range.last;
            throw_error(std::move(info));
        }
        if (const auto *attr = node->first_attribute(checksum_attr); attr != nullptr)
        {
            const std::string_view sum =
                trim_whitespace(std::string_view(attr->value(), attr->value_size()));
            if (sum.size() != hex_chars)
            {
                format_error(ErrorKind::Format,
                             fmt::format("malformed checksum '{}' for block range {}-{} in bmap "
                                         "file '{}'",
                                         sum, range.first, range.last, origin),
                             origin);
            }
            range.checksum = std::string(sum);
        }
        doc.ranges.push_back(std::move(range));
    }
}

} // namespace

bool parse_range_text(std::string_view text, uint64_t &first, uint64_t &last) noexcept
{
    text = trim_whitespace(text);
    const auto dash = text.find('-');
    if (dash == std::string_view::npos)
    {
        if (!parse_u64(text, first))
            return false;
        last = first;
        return true;
    }
    if (!parse_u64(text.substr(0, dash), first) || !parse_u64(text.substr(dash + 1), last))
    {
        return false;
    }
    return first <= last;
}

BmapDocument parse_bmap(std::string_view bytes, std::string origin)
{
    BmapDocument doc;
    doc.origin = std::move(origin);
    BmapMetadata &md = doc.metadata;
    md.from_document = true;

    // rapidxml needs a mutable, NUL-terminated buffer that outlives the DOM.
    std::string buffer(bytes);
    rapidxml::xml_document<> xml;
    try
    {
        xml.parse<0>(buffer.data());
    }
    catch (const rapidxml::parse_error &e)
    {
        format_error(ErrorKind::Format,
                     fmt::format("cannot parse the bmap file '{}' which should be a proper XML "
                                 "file: {}",
                                 doc.origin, e.what()),
                     doc.origin);
    }

    const XmlNode *root = xml.first_node("bmap");
    if (root == nullptr)
    {
        format_error(ErrorKind::Format,
                     fmt::format("the bmap file '{}' has no 'bmap' root element", doc.origin),
                     doc.origin);
    }

    parse_version(root, md, doc.origin);
    md.checksum_type = parse_checksum_type(root, md, doc.origin);
    if (has_self_checksum(md))
    {
        verify_self_checksum(bytes, buffer.data(), root, md, doc.origin);
    }

    md.block_size = required_u64(root, "BlockSize", doc.origin);
    if (md.block_size == 0)
    {
        format_error(ErrorKind::Format,
                     fmt::format("the bmap file '{}' declares a zero block size", doc.origin),
                     doc.origin);
    }
    const uint64_t blocks = required_u64(root, "BlocksCount", doc.origin);
    const uint64_t mapped = required_u64(root, "MappedBlocksCount", doc.origin);
    uint64_t image_size = blocks * md.block_size;
    if (root->first_node("ImageSize") != nullptr)
    {
        image_size = required_u64(root, "ImageSize", doc.origin);
    }

    if (blocks_for_bytes(image_size, md.block_size) != blocks)
    {
        format_error(ErrorKind::InconsistentMetadata,
                     "Inconsistent bmap - image size does not match blocks count", doc.origin);
    }
    if (mapped > blocks)
    {
        format_error(ErrorKind::InconsistentMetadata,
                     fmt::format("Inconsistent bmap - {} mapped blocks but only {} blocks in "
                                 "total",
                                 mapped, blocks),
                     doc.origin);
    }
    md.set_block_counts(blocks, mapped);
    md.set_image_size(image_size);

    parse_ranges(root, doc);

    LOGGER_DEBUG("[bmap] parsed '{}': version {}.{}, block size {}, {} of {} blocks mapped in {} "
                 "ranges, checksum {}",
                 doc.origin, md.version_major, md.version_minor, md.block_size, mapped, blocks,
                 doc.ranges.size(), to_string(md.checksum_type));
    return doc;
}

BmapDocument parse_bmap_file(const std::filesystem::path &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        const int err = errno;
        throw_io_error(fmt::format("cannot open bmap file '{}': {}", path.string(),
                                   std::strerror(err)),
                       path.string(), err);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
    {
        const int err = errno;
        throw_io_error(fmt::format("cannot read bmap file '{}'", path.string()), path.string(),
                       err);
    }
    return parse_bmap(ss.str(), path.string());
}

} // namespace bmapcopy::bmap
