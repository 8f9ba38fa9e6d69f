#pragma once
/**
 * @file parser.hpp
 * @brief Parsing and validation of block-map XML documents.
 *
 * Checks, in order:
 *  1. the root `version` attribute (major <= SUPPORTED_MAJOR_VERSION);
 *  2. the document self-checksum (versions >= 1.3) before any other field is trusted;
 *  3. the geometry fields and their consistency;
 *  4. the checksum type and the `BlockMap` ranges (strictly increasing, in bounds).
 */
#include "bmapcopy_core_export.h"
#include "bmap/metadata.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace bmapcopy::bmap
{

/**
 * @brief Parses a block map held in memory.
 * @param bytes  The raw document.
 * @param origin Path or label used in error messages.
 * @throws FormatError (and subclasses), ChecksumMismatchError.
 */
BMAPCOPY_CORE_EXPORT BmapDocument parse_bmap(std::string_view bytes, std::string origin);

/**
 * @brief Reads and parses a block-map file.
 * @throws IOError if the file cannot be read, then as parse_bmap().
 */
BMAPCOPY_CORE_EXPORT BmapDocument parse_bmap_file(const std::filesystem::path &path);

/**
 * @brief Parses the text of a `Range` element, "N" or "N-M".
 * @return false if the text is not one of the two forms.
 */
BMAPCOPY_CORE_EXPORT bool parse_range_text(std::string_view text, uint64_t &first,
                                           uint64_t &last) noexcept;

} // namespace bmapcopy::bmap
