#pragma once

#include <string>
#include <vector>

namespace url {

// Percent-encode a query component. RFC 3986 unreserved bytes
// (A-Z a-z 0-9 - . _ ~) pass through; every other byte becomes %XX with
// uppercase hex. Space is %20, never '+'.
std::string percent_encode(const std::string& input);

// Inverse of percent_encode. Malformed escapes are kept as literal text.
std::string percent_decode(const std::string& input);

// https://github.com/{owner}/{repo}/issues/new?title=..&body=..[&labels=..]
// Labels are joined with ',' and encoded as one value (so "a,b" -> a%2Cb);
// the labels parameter is left out when there are none.
// Owner and repo must already be validated as non-empty.
std::string build_issue_url(const std::string& owner, const std::string& repo,
                            const std::string& title, const std::string& body,
                            const std::vector<std::string>& labels);

// Value of query parameter `key` in `url`, still encoded. Empty if absent.
std::string query_param(const std::string& url, const std::string& key);

} // namespace url
