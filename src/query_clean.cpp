#include "query_clean.h"
#include <curl/curl.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <memory>
#include <set>

// generic URL grammar, any scheme; keep "/./" and "/../" as written
static constexpr unsigned int kParseFlags = CURLU_NON_SUPPORT_SCHEME | CURLU_PATH_AS_IS;

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  return absl::ascii_tolower(static_cast<unsigned char>(c)) - 'a' + 10;
}

static absl::Status parse_error(const std::string& url, absl::string_view why) {
  return absl::InvalidArgumentError(absl::StrFormat("cannot parse URL \"%s\": %s", url, why));
}

// libcurl only validates the URL. The output is the input text with the query
// replaced, so scheme, authority, path and fragment come back byte for byte.
static absl::StatusOr<std::string> filter_and_reassemble(const std::string& url,
                                                         const std::set<std::string>& blocklist) {
  if (url.find('\0') != std::string::npos) return parse_error(url, "embedded NUL byte");

  std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> h(curl_url(), &curl_url_cleanup);
  if (!h) return absl::InternalError("curl_url() failed");

  CURLUcode rc = curl_url_set(h.get(), CURLUPART_URL, url.c_str(), kParseFlags);
  if (rc != CURLUE_OK) return parse_error(url, curl_url_strerror(rc));

  // the first '?' ends scheme/authority/path; a '#' before it means no query
  const size_t frag = url.find('#');
  const size_t qpos = url.find('?');
  if (qpos == std::string::npos || qpos > frag) return url;
  const size_t qend = (frag == std::string::npos) ? url.size() : frag;

  auto params = parse_query(std::string_view(url).substr(qpos + 1, qend - qpos - 1));
  if (!params.ok()) return parse_error(url, params.status().message());

  std::vector<absl::string_view> kept;
  for (const auto& p : *params) {
    if (blocklist.count(p.name)) continue;
    kept.push_back(p.raw);
  }

  std::string out = url.substr(0, qpos);
  if (!kept.empty()) {
    out.push_back('?');
    out += absl::StrJoin(kept, "&");
  }
  out.append(url, qend, std::string::npos);
  return out;
}

std::optional<std::string> form_decode(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%') {
      if (i + 2 >= s.size()) return std::nullopt;
      if (!absl::ascii_isxdigit(static_cast<unsigned char>(s[i + 1])) ||
          !absl::ascii_isxdigit(static_cast<unsigned char>(s[i + 2]))) {
        return std::nullopt;
      }
      out.push_back(static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2])));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

absl::StatusOr<std::vector<QueryParam>> parse_query(std::string_view query) {
  std::vector<QueryParam> out;
  for (absl::string_view piece :
       absl::StrSplit(absl::string_view(query.data(), query.size()), '&', absl::SkipEmpty())) {
    std::string_view part(piece.data(), piece.size());
    QueryParam p;
    p.raw = std::string(part);

    std::string_view name = part;
    std::optional<std::string_view> value;
    if (auto eq = part.find('='); eq != std::string_view::npos) {
      name = part.substr(0, eq);
      value = part.substr(eq + 1);
    }

    auto decoded_name = form_decode(name);
    if (!decoded_name) {
      return absl::InvalidArgumentError(
          absl::StrFormat("bad percent-encoding in query parameter name \"%s\"", name));
    }
    p.name = std::move(*decoded_name);

    if (value) {
      auto decoded_value = form_decode(*value);
      if (!decoded_value) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "bad percent-encoding in value of query parameter \"%s\"", p.name));
      }
      p.value = std::move(*decoded_value);
    }
    out.push_back(std::move(p));
  }
  return out;
}

absl::StatusOr<std::string> clean_url(const std::string& url,
                                      const std::vector<std::string>& blocklist) {
  return filter_and_reassemble(url, std::set<std::string>(blocklist.begin(), blocklist.end()));
}

absl::StatusOr<std::string> untrack_url(const std::string& url, const TrackingPolicy& policy) {
  return filter_and_reassemble(url, resolve_blocklist(policy));
}

bool is_parse_error(const absl::Status& status) {
  return status.code() == absl::StatusCode::kInvalidArgument;
}
