#pragma once

#include <string>

namespace fetcher::detail {

// Last path segment of `url` without query or fragment; "index.html" when
// the URL names a directory.
std::string fileNameFromUrl(const std::string& url);

// "dir/name.ext" -> "dir/name (n).ext"
std::string numberedPath(const std::string& origin_path, int n);

} // namespace fetcher::detail
