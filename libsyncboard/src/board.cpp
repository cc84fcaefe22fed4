/**
 * @file board.cpp
 * @brief Board aggregate
 */

#include "syncboard/board.h"
#include <spdlog/spdlog.h>

namespace syncboard {

Board::Board(const BoardConfig &config)
    : config_(config), clipboard_(config.max_text_size_bytes),
      files_(config.files) {}

Board::~Board() { shutdown(); }

void Board::shutdown() {
  auto clients = clients_.count();
  auto files = files_.clear();
  clients_.clear();
  if (clients > 0 || !files.empty()) {
    spdlog::debug("Board shut down: dropped {} clients, {} files", clients,
                  files.size());
  }
}

} // namespace syncboard
