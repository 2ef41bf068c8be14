#include "arrow_utils.hpp"

#include <cstring>

namespace chunkscribe::storage::common {

std::shared_ptr<arrow::Buffer> CopyToBuffer(std::string_view bytes) {
  auto result = arrow::AllocateBuffer(static_cast<int64_t>(bytes.size()));
  if (!result.ok()) throw std::runtime_error(result.status().ToString());

  std::unique_ptr<arrow::Buffer> buffer = std::move(result).ValueOrDie();
  if (!bytes.empty()) {
    std::memcpy(buffer->mutable_data(), bytes.data(), bytes.size());
  }
  return std::shared_ptr<arrow::Buffer>(std::move(buffer));
}

} // namespace chunkscribe::storage::common
