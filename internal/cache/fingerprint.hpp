#pragma once

#include <map>
#include <string>

namespace chunkscribe::cache {

// Named inputs of a computation. std::map keeps the encoding order canonical.
using CacheInputs = std::map<std::string, std::string>;

/*
  Lower-case hex SHA-256 over

      u64be(len(kind)) kind  { u64be(len(name)) name u64be(len(value)) value }*

  with inputs in name order. Length prefixes make the encoding injective,
  so ("ab","c") and ("a","bc") never collide.
*/
std::string Fingerprint(const std::string& kind, const CacheInputs& inputs);

} // namespace chunkscribe::cache
