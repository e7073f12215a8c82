#include "toggl/types.hpp"

#include <cctype>
#include <sstream>

namespace toggl {

static bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string find_header(const Headers& headers, const std::string& name) {
    for (Headers::const_iterator it = headers.begin(); it != headers.end(); ++it) {
        if (iequals(it->first, name)) {
            return it->second;
        }
    }
    return "";
}

const char* http_reason_phrase(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 402: return "Payment Required";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 415: return "Unsupported Media Type";
        case 422: return "Unprocessable Entity";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "";
    }
}

std::string parse_status_line(const std::string& line) {
    if (line.compare(0, 5, "HTTP/") != 0) {
        return "";
    }

    std::string trimmed = line;
    while (!trimmed.empty() && (trimmed[trimmed.size() - 1] == '\n' ||
                                trimmed[trimmed.size() - 1] == '\r' ||
                                trimmed[trimmed.size() - 1] == ' ')) {
        trimmed.erase(trimmed.size() - 1);
    }

    size_t sp = trimmed.find(' ');
    return (sp == std::string::npos) ? std::string() : trimmed.substr(sp + 1);
}

std::string complete_status(const std::string& status, int status_code) {
    if (status.find(' ') != std::string::npos) {
        return status;
    }

    std::string out = status;
    if (out.empty()) {
        std::ostringstream oss;
        oss << status_code;
        out = oss.str();
    }
    const char* reason = http_reason_phrase(status_code);
    if (reason[0] != '\0') {
        out += std::string(" ") + reason;
    }
    return out;
}

} /* namespace toggl */
