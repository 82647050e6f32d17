#include "wfp_format.hpp"

#include <cstring>
#include <stdexcept>

namespace winnow {

std::string hashHex(uint32_t hash) {
    static const char digits[] = "0123456789abcdef";
    std::string hex(WFP_HASH_WIDTH, '0');
    for (size_t i = WFP_HASH_WIDTH; i-- > 0;) {
        hex[i] = digits[hash & 0x0F];
        hash >>= 4;
    }
    return hex;
}

bool isWfpPath(const std::string& path) {
    return path.find_first_of("\r\n") == std::string::npos;
}

void appendRecord(std::string& out, const FileRecord& record) {
    if (!isWfpPath(record.path))
        throw std::invalid_argument("line break in path, cannot write WFP: " +
                                    record.path);

    out += WFP_FILE_START;
    out += record.md5;
    out += ',';
    out += std::to_string(record.size);
    out += ',';
    out += record.path;
    out += '\n';

    bool open = false;
    uint32_t currentLine = 0;
    for (const FingerprintEntry& entry : record.fingerprint) {
        if (open && entry.line == currentLine) {
            out += ',';
        } else {
            if (open) out += '\n';
            out += std::to_string(entry.line);
            out += '=';
            currentLine = entry.line;
            open = true;
        }
        out += hashHex(entry.hash);
    }
    if (open) out += '\n';
}

std::string serializeRecord(const FileRecord& record) {
    std::string out;
    // header + roughly "NNNN=xxxxxxxx\n" per entry
    out.reserve(64 + record.path.size() + record.fingerprint.size() * 14);
    appendRecord(out, record);
    return out;
}

size_t countFilesInWfp(const std::string& wfp) {
    const size_t prefixLen = std::strlen(WFP_FILE_START);
    size_t count = 0;
    size_t lineStart = 0;
    while (lineStart < wfp.size()) {
        if (wfp.compare(lineStart, prefixLen, WFP_FILE_START) == 0) count++;
        const size_t nl = wfp.find('\n', lineStart);
        if (nl == std::string::npos) break;
        lineStart = nl + 1;
    }
    return count;
}

}  // namespace winnow
