// Source spans into the preprocessed text
#pragma once
#include <cstddef>
#include <string_view>
#include <vector>

namespace wikitext {

// Half-open byte range [start, end).
struct Span {
    size_t start = 0;
    size_t end = 0;

    size_t size() const { return end > start ? end - start : 0; }
    bool empty() const { return end <= start; }
    bool contains(const Span& o) const { return start <= o.start && o.end <= end; }
    bool operator==(const Span& o) const { return start == o.start && end == o.end; }
    bool operator!=(const Span& o) const { return !(*this == o); }
};

// Maps byte offsets to 1-based line/column pairs (used by diagnostics output).
class LineIndex {
public:
    explicit LineIndex(std::string_view text);
    int line(size_t offset) const;
    int col(size_t offset) const;
private:
    std::vector<size_t> starts_;
};

} // namespace wikitext
