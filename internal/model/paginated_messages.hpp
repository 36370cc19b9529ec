#pragma once

#include <utility>
#include <vector>

#include "internal/model/message.hpp"

namespace schedstore::model {

struct PaginatedMessages {
  std::vector<Message> messages;
  bool                 has_next_page = false;

  static PaginatedMessages FromMessages(std::vector<Message> messages, bool has_next_page) {
    PaginatedMessages page;
    page.messages      = std::move(messages);
    page.has_next_page = has_next_page;
    return page;
  }
};

} // namespace schedstore::model
