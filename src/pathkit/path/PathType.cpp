#include "path/PathType.hpp"

#include "log/TaggedLogger.hpp"

#include <utility>

namespace {

using PK::Error;
using PK::Expected;
using PK::ParsedPath;

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

auto make_path_error(std::string message, std::string_view input) -> Error {
    pk_log("Rejected path '" + std::string(input) + "': " + message, "PathType");
    return Error{Error::Code::MalformedPath, std::move(message) + ": " + std::string(input)};
}

auto join_parts(std::span<std::string_view const> parts, char separator) -> std::string {
    std::string joined;
    for (auto const& part : parts) {
        if (part.empty()) {
            continue;
        }
        if (!joined.empty()) {
            joined.push_back(separator);
        }
        joined.append(part);
    }
    return joined;
}

auto split_names(std::string_view rest, char separator) -> std::vector<std::string> {
    std::vector<std::string> names;
    std::size_t              pos = 0;
    while (pos < rest.size()) {
        auto next = rest.find(separator, pos);
        auto end  = (next == std::string_view::npos) ? rest.size() : next;
        if (end > pos) {
            names.emplace_back(rest.substr(pos, end - pos));
        }
        if (next == std::string_view::npos) {
            break;
        }
        pos = next + 1;
    }
    return names;
}

auto is_drive_letter(char ch) -> bool {
    return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z');
}

auto is_reserved_windows_char(char ch) -> bool {
    switch (ch) {
    case '<':
    case '>':
    case ':':
    case '"':
    case '|':
    case '?':
    case '*':
        return true;
    default:
        return static_cast<unsigned char>(ch) < 0x20;
    }
}

auto check_windows_names(std::string_view joined, std::size_t offset) -> std::optional<Error> {
    for (std::size_t idx = offset; idx < joined.size(); ++idx) {
        if (is_reserved_windows_char(joined[idx])) {
            auto shown = static_cast<unsigned char>(joined[idx]) < 0x20 ? std::string("control character")
                                                                       : "'" + std::string(1, joined[idx]) + "'";
            return make_path_error("illegal char " + shown + " at index " + std::to_string(idx), joined);
        }
    }
    return std::nullopt;
}

auto parse_posix(std::string joined) -> Expected<ParsedPath> {
    if (auto nul = joined.find('\0'); nul != std::string::npos) {
        return std::unexpected(make_path_error("nul character not allowed at index " + std::to_string(nul), joined));
    }

    ParsedPath parsed;
    if (!joined.empty() && joined.front() == '/') {
        parsed.root = "/";
    }
    parsed.names = split_names(joined, '/');
    return parsed;
}

auto parse_unc_root(std::string_view joined) -> Expected<std::pair<std::string, std::size_t>> {
    // joined starts with two separators
    auto const hostStart = std::size_t{2};
    auto const hostEnd   = joined.find('\\', hostStart);
    auto const host      = joined.substr(hostStart, hostEnd == std::string_view::npos ? std::string_view::npos : hostEnd - hostStart);
    if (host.empty()) {
        return std::unexpected(make_path_error("UNC path is missing hostname", joined));
    }
    if (hostEnd == std::string_view::npos) {
        return std::unexpected(make_path_error("UNC path is missing sharename", joined));
    }

    auto const shareStart = hostEnd + 1;
    auto const shareEnd   = joined.find('\\', shareStart);
    auto const share      = joined.substr(shareStart, shareEnd == std::string_view::npos ? std::string_view::npos : shareEnd - shareStart);
    if (share.empty()) {
        return std::unexpected(make_path_error("UNC path is missing sharename", joined));
    }

    std::string root;
    root.reserve(host.size() + share.size() + 4);
    root.append("\\\\").append(host).append("\\").append(share).append("\\");
    auto const consumed = shareEnd == std::string_view::npos ? joined.size() : shareEnd;
    return std::pair{std::move(root), consumed};
}

auto parse_windows(std::string joined) -> Expected<ParsedPath> {
    for (auto& ch : joined) {
        if (ch == '/') {
            ch = '\\';
        }
    }

    ParsedPath  parsed;
    std::size_t offset = 0;

    if (joined.starts_with("\\\\")) {
        auto unc = parse_unc_root(joined);
        if (!unc) {
            return std::unexpected(unc.error());
        }
        if (auto error = check_windows_names(std::string_view{joined}.substr(0, unc->second), 2)) {
            return std::unexpected(*error);
        }
        parsed.root = std::move(unc->first);
        offset      = unc->second;
    } else if (joined.starts_with('\\')) {
        return std::unexpected(make_path_error("absolute path on the current drive is not supported", joined));
    } else if (joined.size() >= 2 && joined[1] == ':') {
        if (!is_drive_letter(joined[0])) {
            return std::unexpected(make_path_error("invalid drive letter", joined));
        }
        if (joined.size() == 2 || joined[2] != '\\') {
            return std::unexpected(make_path_error("drive-relative paths are not supported", joined));
        }
        parsed.root = joined.substr(0, 3);
        offset      = 3;
    }

    if (auto error = check_windows_names(joined, offset)) {
        return std::unexpected(*error);
    }
    parsed.names = split_names(std::string_view{joined}.substr(offset), '\\');
    return parsed;
}

} // namespace

namespace PK {

PathType::PathType(Syntax syntax)
    : syntax_(syntax) {}

auto PathType::posix() -> PathType {
    return PathType{Posix{}};
}

auto PathType::windows() -> PathType {
    return PathType{Windows{}};
}

auto PathType::name() const noexcept -> std::string_view {
    return std::visit(overloaded{[](Posix const&) { return std::string_view{"posix"}; },
                                 [](Windows const&) { return std::string_view{"windows"}; }},
                      syntax_);
}

auto PathType::separator() const noexcept -> std::string_view {
    return std::visit(overloaded{[](Posix const&) { return std::string_view{"/"}; },
                                 [](Windows const&) { return std::string_view{"\\"}; }},
                      syntax_);
}

auto PathType::otherSeparators() const noexcept -> std::string_view {
    return std::visit(overloaded{[](Posix const&) { return std::string_view{}; },
                                 [](Windows const&) { return std::string_view{"/"}; }},
                      syntax_);
}

auto PathType::parse(std::span<std::string_view const> parts) const -> Expected<ParsedPath> {
    auto joined = join_parts(parts, separator().front());
    return std::visit(overloaded{[&joined](Posix const&) { return parse_posix(std::move(joined)); },
                                 [&joined](Windows const&) { return parse_windows(std::move(joined)); }},
                      syntax_);
}

auto PathType::parse(std::string_view path) const -> Expected<ParsedPath> {
    return parse(std::span<std::string_view const>{&path, 1});
}

auto PathType::render(Name const* root, std::span<Name const> names) const -> std::string {
    auto const sep = separator();

    std::size_t required = root ? root->display().size() + 1 : 0;
    for (auto const& name : names) {
        required += name.display().size() + 1;
    }

    std::string result;
    result.reserve(required);
    if (root) {
        result.append(root->display());
        if (!names.empty() && !result.ends_with(sep)) {
            result.append(sep);
        }
    }
    for (std::size_t idx = 0; idx < names.size(); ++idx) {
        if (idx > 0) {
            result.append(sep);
        }
        result.append(names[idx].display());
    }
    return result;
}

} // namespace PK
