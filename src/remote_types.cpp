#include "panxfer/remote_types.hpp"

#include <chrono>

namespace panxfer {

namespace {

constexpr size_t kMaxNameBytes = 255;

// Cut to at most `max` bytes without splitting a UTF-8 sequence.
std::string truncate_utf8(const std::string& s, size_t max) {
    if (s.size() <= max) return s;
    size_t cut = max;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut);
}

void split_extension(const std::string& name, std::string& base, std::string& ext) {
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        base = name;
        ext.clear();
    } else {
        base = name.substr(0, dot);
        ext = name.substr(dot);
    }
}

std::string with_suffix(const std::string& name, const std::string& suffix) {
    std::string base, ext;
    split_extension(name, base, ext);
    size_t room = kMaxNameBytes > suffix.size() + ext.size()
                      ? kMaxNameBytes - suffix.size() - ext.size() : 0;
    return truncate_utf8(base, room) + suffix + ext;
}

}  // namespace

std::string normalize_path(const std::string& path) {
    std::string out = "/";
    for (const auto& part : split_path(path)) {
        if (out.size() > 1) out += '/';
        out += part;
    }
    return out;
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string::npos) next = path.size();
        if (next > pos) parts.push_back(path.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

std::string parent_path_of(const std::string& path) {
    std::string p = normalize_path(path);
    size_t slash = p.rfind('/');
    if (slash == 0 || slash == std::string::npos) return "/";
    return p.substr(0, slash);
}

std::string base_name_of(const std::string& path) {
    std::string p = normalize_path(path);
    if (p == "/") return {};
    return p.substr(p.rfind('/') + 1);
}

std::string join_path(const std::string& dir, const std::string& name) {
    return normalize_path(dir + "/" + name);
}

std::string clean_file_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        switch (c) {
            case '"': case '\\': case '/': case ':': case '*':
            case '?': case '|': case '>': case '<':
                out += '_';
                break;
            default:
                out += c;
        }
    }
    while (!out.empty() && out.back() == ' ') out.pop_back();
    return truncate_utf8(out, kMaxNameBytes);
}

std::string numbered_name(const std::string& name, size_t n) {
    return with_suffix(name, " (" + std::to_string(n) + ")");
}

std::string timestamped_name(const std::string& name, int64_t unix_seconds) {
    return with_suffix(name, "_" + std::to_string(unix_seconds));
}

int64_t now_epoch_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace panxfer
