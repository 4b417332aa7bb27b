#include "StderrTail.hpp"

namespace mc {

StderrTail::StderrTail(usize capacity) : capacity_(capacity > 0 ? capacity : 1) {}

void StderrTail::append(const QByteArray& data) {
    for (char c : data) {
        if (c == '\n' || c == '\r') {
            if (!partial_.empty())
                push(std::move(partial_));
            partial_.clear();
        } else {
            partial_.push_back(c);
        }
    }
    if (partial_.size() > kMaxLineBytes)
        partial_.erase(0, partial_.size() - kMaxLineBytes);
}

void StderrTail::flush() {
    if (!partial_.empty()) {
        push(std::move(partial_));
        partial_.clear();
    }
}

void StderrTail::push(std::string line) {
    lines_.push_back(std::move(line));
    while (lines_.size() > capacity_)
        lines_.pop_front();
}

std::vector<std::string> StderrTail::lines() const {
    return {lines_.begin(), lines_.end()};
}

std::string StderrTail::joined() const {
    std::string out;
    for (const auto& line : lines_) {
        if (!out.empty())
            out += '\n';
        out += line;
    }
    return out;
}

} // namespace mc
