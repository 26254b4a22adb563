#pragma once

#include "runtime/tensors/tensor.h"

#include <cstddef>
#include <string>
#include <vector>

namespace decodeflux {

struct KVCacheEntry {
  Tensor key;
  Tensor value;
};

// Input bundle submitted to one inference call.  Every slot exclusively owns
// its tensor; assigning a new tensor to a slot releases the previous one.
struct Feed {
  Tensor input_ids;
  Tensor attention_mask;
  Tensor position_ids;
  std::vector<KVCacheEntry> past_key_values; // indexed by layer

  // Named views over every owned slot, in session input order:
  // input_ids, attention_mask, position_ids, past_key_values.<i>.key/value.
  TensorBinding Bind() const;

  // Number of owned slots Bind() would return.
  std::size_t BoundCount() const;

  // Release the per-step slots (input_ids, attention_mask, position_ids).
  void ReleaseTransient();

  // Release every cache tensor that lives in device memory.
  void ReleaseDeviceCache();

  // Release every slot and drop the cache layout.
  void Clear();
};

std::string PastKeyName(std::size_t layer);
std::string PastValueName(std::size_t layer);

} // namespace decodeflux
