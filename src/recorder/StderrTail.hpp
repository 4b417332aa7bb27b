/**
 * @file StderrTail.hpp
 * @brief Bounded buffer of the last lines an encoder wrote to stderr.
 */

#pragma once
#include <QByteArray>
#include <deque>
#include <string>
#include <vector>
#include "util/Types.hpp"

namespace mc {

class StderrTail {
public:
    // An unterminated line keeps only its last kMaxLineBytes
    static constexpr usize kMaxLineBytes = 4096;

    explicit StderrTail(usize capacity = 20);

    // Accepts arbitrary fragments; a line is kept once its newline arrives
    void append(const QByteArray& data);
    // Commits a trailing line that never got its newline
    void flush();

    std::vector<std::string> lines() const;
    std::string joined() const;
    bool empty() const {
        return lines_.empty() && partial_.empty();
    }

private:
    void push(std::string line);

    usize capacity_;
    std::deque<std::string> lines_;
    std::string partial_;
};

} // namespace mc
