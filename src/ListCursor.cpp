#include "ListCursor.h"

void ListCursor::Next(std::size_t count) {
  if (count == 0) return;
  if (!index_) {
    index_ = 0;
    return;
  }
  index_ = (*index_ + 1 >= count) ? 0 : *index_ + 1;
}

void ListCursor::Previous(std::size_t count) {
  if (count == 0) return;
  if (!index_) {
    index_ = 0;
    return;
  }
  index_ = (*index_ == 0) ? count - 1 : *index_ - 1;
}

void ListCursor::Clamp(std::size_t count) {
  if (!index_) return;
  if (count == 0) {
    index_.reset();
  } else if (*index_ >= count) {
    index_ = count - 1;
  }
}

void ListCursor::OnRemoved(std::size_t removed) {
  if (!index_) return;
  if (removed < *index_) {
    index_ = *index_ - 1;
  } else if (removed == *index_) {
    index_.reset();
  }
}
