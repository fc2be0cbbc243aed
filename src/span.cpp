#include "wikitext/span.hpp"
#include <algorithm>

namespace wikitext {

LineIndex::LineIndex(std::string_view text){
    starts_.push_back(0);
    for(size_t i=0;i<text.size();++i)
        if(text[i]=='\n') starts_.push_back(i+1);
}

int LineIndex::line(size_t offset) const {
    auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
    return static_cast<int>(it - starts_.begin());
}

int LineIndex::col(size_t offset) const {
    size_t ln = static_cast<size_t>(line(offset));
    return static_cast<int>(offset - starts_[ln-1]) + 1;
}

} // namespace wikitext
