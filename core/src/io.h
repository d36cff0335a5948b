#pragma once

#include <iosfwd>
#include <string>

namespace sceneql::io {

/// Loads file contents. MUST throw std::runtime_error on IO errors.
std::string read_file(const std::string& path);
/// Reads all of an input stream such as stdin.
std::string read_stream(std::istream& in);
/// Fetches a JSON document over HTTP(S) when libcurl support is compiled in.
/// MUST honor timeout_ms and MUST throw on transfer failures or non-JSON content.
std::string fetch_url(const std::string& url, int timeout_ms);
/// True for http:// and https:// locations.
bool is_url(const std::string& location);

}  // namespace sceneql::io
