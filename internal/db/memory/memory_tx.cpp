#include "memory_tx.hpp"

#include <stdexcept>

namespace flightline::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.mutex_) {
}

MemoryTransaction::~MemoryTransaction() {
  Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (finished_) {
    throw std::logic_error("write after transaction finished");
  }
  if (!working_) {
    working_.emplace(repo_.committed_);
  }
  return *working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  return working_ ? *working_ : repo_.committed_;
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw std::logic_error("transaction already finished");
  }
  if (working_) {
    repo_.committed_ = std::move(*working_);
    working_.reset();
  }
  finished_ = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (finished_) {
    return;
  }
  working_.reset();
  finished_ = true;
  lock_.unlock();
}

} // namespace flightline::db::memory
