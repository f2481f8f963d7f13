// pipeline/frame_protocol.hpp
// FrameProtocol concept - compile-time interface shared by FrameParser and
// FrameSender. Implemented by stack::ArpProtocol and stack::IcmpProtocol.
#pragma once

#include <concepts>
#include <cstddef>

#include "../stack/validation.hpp"

namespace responder::pipeline {

// Requirements:
//   - Frame                 fixed-size byte container (operator[], size(), data())
//   - NAME                  short protocol tag for logs
//   - FRAME_LEN             bytes per request and per reply
//   - ABORT_ON_END_OF_FRAME parser drops a partial frame on falling edge
//   - validate(frame, id)   -> stack::ValidationResult
//   - build_reply(req, id)  -> Frame
template<typename P>
concept FrameProtocol = requires(const typename P::Frame& f, const stack::Identity& id) {
    { P::NAME } -> std::convertible_to<const char*>;
    { P::FRAME_LEN } -> std::convertible_to<size_t>;
    { P::ABORT_ON_END_OF_FRAME } -> std::convertible_to<bool>;
    { P::validate(f, id) } -> std::same_as<stack::ValidationResult>;
    { P::build_reply(f, id) } -> std::same_as<typename P::Frame>;
} && (sizeof(typename P::Frame) == P::FRAME_LEN);

}  // namespace responder::pipeline
