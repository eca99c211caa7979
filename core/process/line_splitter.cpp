#include "line_splitter.hpp"

namespace qode {
namespace process {

namespace {
void strip_carriage_return(std::string &line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}
}  // namespace

std::vector<std::string> LineSplitter::push(const char *data, size_t len) {
    std::vector<std::string> lines;
    pending_.append(data, len);

    size_t start = 0;
    size_t newline;
    while ((newline = pending_.find('\n', start)) != std::string::npos) {
        std::string line = pending_.substr(start, newline - start);
        strip_carriage_return(line);
        lines.push_back(std::move(line));
        start = newline + 1;
    }
    pending_.erase(0, start);
    return lines;
}

std::vector<std::string> LineSplitter::finish() {
    std::vector<std::string> lines;
    strip_carriage_return(pending_);
    if (!pending_.empty()) {
        lines.push_back(std::move(pending_));
    }
    pending_.clear();
    return lines;
}

}  // namespace process
}  // namespace qode
