#include "macros.hh"
#include "sink.common.hh"

#include <algorithm>
#include <cctype>

namespace {
constexpr std::string_view file_scheme_prefix = "file://";
constexpr std::string_view s3_scheme_prefix = "s3://";
constexpr std::string_view scheme_separator = "://";
} // namespace

std::string
shardsink::trim(std::string_view s)
{
    if (s.empty()) {
        return {};
    }

    // trim left
    std::string trimmed(s);
    trimmed.erase(trimmed.begin(),
                  std::find_if(trimmed.begin(), trimmed.end(), [](char c) {
                      return !std::isspace(static_cast<unsigned char>(c));
                  }));

    // trim right
    trimmed.erase(std::find_if(trimmed.rbegin(),
                               trimmed.rend(),
                               [](char c) {
                                   return !std::isspace(
                                     static_cast<unsigned char>(c));
                               })
                    .base(),
                  trimmed.end());

    return trimmed;
}

bool
shardsink::is_empty_string(std::string_view s, std::string_view err_on_empty)
{
    auto trimmed = trim(s);
    if (trimmed.empty()) {
        LOG_ERROR(err_on_empty);
        return true;
    }
    return false;
}

shardsink::Scheme
shardsink::scheme_of(std::string_view path)
{
    if (path.starts_with(s3_scheme_prefix)) {
        return Scheme::S3;
    }

    if (path.starts_with(file_scheme_prefix)) {
        return Scheme::Local;
    }

    // a scheme is a run of letters before "://"
    const auto pos = path.find(scheme_separator);
    if (pos != std::string_view::npos && pos > 0 &&
        std::all_of(path.begin(), path.begin() + pos, [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '+' ||
                   c == '-' || c == '.';
        })) {
        return Scheme::Unsupported;
    }

    return Scheme::Local;
}

const char*
shardsink::scheme_to_string(Scheme scheme)
{
    switch (scheme) {
        case Scheme::Local:
            return "local";
        case Scheme::S3:
            return "s3";
        default:
            return "(unsupported)";
    }
}

std::string_view
shardsink::strip_file_scheme(std::string_view path)
{
    if (path.starts_with(file_scheme_prefix)) {
        path.remove_prefix(file_scheme_prefix.size());
    }
    return path;
}

shardsink::S3Path
shardsink::parse_s3_path(std::string_view uri)
{
    EXPECT(uri.starts_with(s3_scheme_prefix), "Not an S3 URI: ", uri);
    uri.remove_prefix(s3_scheme_prefix.size());

    S3Path path;
    const auto slash = uri.find('/');
    if (slash == std::string_view::npos) {
        path.bucket = uri;
    } else {
        path.bucket = uri.substr(0, slash);
        path.object = uri.substr(slash + 1);
    }

    EXPECT(!path.bucket.empty(), "S3 URI has no bucket: s3://", uri);
    return path;
}

std::string
shardsink::make_s3_uri(const S3Path& path)
{
    return std::string(s3_scheme_prefix) + path.bucket + "/" + path.object;
}

bool
shardsink::matches_glob(std::string_view name, std::string_view pattern)
{
    // iterative wildcard matching with single-star backtracking
    size_t n = 0, p = 0;
    size_t star = std::string_view::npos, resume = 0;

    while (n < name.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = n;
        } else if (p < pattern.size() &&
                   (pattern[p] == '?' || pattern[p] == name[n])) {
            ++n;
            ++p;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            n = ++resume;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }

    return p == pattern.size();
}

std::string_view
shardsink::glob_literal_prefix(std::string_view pattern)
{
    return pattern.substr(0, pattern.find_first_of("*?"));
}
