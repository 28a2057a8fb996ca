#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>


// Malformed diagram, move token or record text. Carries what the parser
// expected, the byte offset where it stopped and the unconsumed input.
class ParseError : public std::runtime_error {
public:
    ParseError(std::string expected, std::size_t offset, std::string remainder);

    [[nodiscard]] const std::string& expected() const { return expected_; }
    [[nodiscard]] std::size_t offset() const { return offset_; }
    [[nodiscard]] const std::string& remainder() const { return remainder_; }

private:
    std::string expected_;
    std::size_t offset_;
    std::string remainder_;
};
