#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "fingerprinter.hpp"

namespace winnow {

// ---------------------------------------------------------------------------
//  WFP text format, parsed field by field by the remote engine:
//
//    file=<md5>,<size>,<path>\n
//    <line>=<hash>[,<hash>...]\n        one line per distinct line number
//
//  Hashes are 8 lowercase hex digits. A request payload is the plain
//  concatenation of its records. The path runs to the end of its line and
//  is not escaped, so a path holding \n or \r cannot be represented.
// ---------------------------------------------------------------------------

constexpr char WFP_FILE_START[] = "file=";
constexpr size_t WFP_HASH_WIDTH = 8;

std::string hashHex(uint32_t hash);

// False for paths containing a line break.
bool isWfpPath(const std::string& path);

// Both throw std::invalid_argument when !isWfpPath(record.path); `out` is
// left untouched in that case.
void appendRecord(std::string& out, const FileRecord& record);
std::string serializeRecord(const FileRecord& record);

// Number of records in a payload (lines starting with "file=").
size_t countFilesInWfp(const std::string& wfp);

}  // namespace winnow
