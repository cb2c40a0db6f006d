#include "stegano/cursor.hpp"

#include "stegano/stream.hpp"

namespace stegano {

StreamCursor::StreamCursor(std::istream& input, Diagnostics& diag)
    : input_(input), diag_(diag), signature_(ReadSignature(input)) {
    offset_ = stream::Position(input_);
    if (!IsCanonical(signature_)) {
        diag_.Warn("PNG signature has a non-standard byte sequence");
    }
}

bool StreamCursor::Next() {
    offset_ = stream::Position(input_);
    return ReadRecord(input_, current_, diag_);
}

bool StreamCursor::AtEnd() {
    return stream::Remaining(input_) == 0;
}

std::uint64_t StreamCursor::Position() {
    return stream::Position(input_);
}

void StreamCursor::Seek(std::uint64_t position) {
    stream::Seek(input_, position);
    offset_ = position;
}

StreamCursor::PositionGuard::PositionGuard(StreamCursor& cursor)
    : cursor_(cursor), position_(cursor.Position()), offset_(cursor.offset()) {}

StreamCursor::PositionGuard::~PositionGuard() {
    cursor_.input_.clear();
    cursor_.input_.seekg(static_cast<std::streamoff>(position_), std::ios::beg);
    cursor_.offset_ = offset_;
}

}  // namespace stegano
