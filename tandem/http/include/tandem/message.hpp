#pragma once

#include "tandem/body.hpp"
#include "tandem/message-head.hpp"

namespace tandem {

// A complete HTTP message: head plus body. Move-only, as its body may own a stream.
struct Message {
  MessageHead head;
  Body body;
};

}  // namespace tandem
