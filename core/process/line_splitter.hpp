#pragma once

#include <string>
#include <vector>

namespace qode {
namespace process {

// Splits a byte stream into lines. Fragments without a terminating '\n'
// are held back until the rest of the line arrives (or finish() is called).
class LineSplitter {
public:
    // Append a chunk; returns the lines it completed (without "\n" / "\r\n")
    std::vector<std::string> push(const char *data, size_t len);

    // End of stream: returns the held-back fragment as a final line, if any
    std::vector<std::string> finish();

    const std::string &pending() const { return pending_; }

private:
    std::string pending_;
};

}  // namespace process
}  // namespace qode
