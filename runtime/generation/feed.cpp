#include "runtime/generation/feed.h"

namespace decodeflux {

namespace {

void ReleaseIfOwned(Tensor &t) {
  if (t.IsOwned()) {
    t.Release();
  }
}

void ReleaseIfDevice(Tensor &t) {
  if (t.IsDeviceResident()) {
    t.Release();
  }
}

} // namespace

std::string PastKeyName(std::size_t layer) {
  return "past_key_values." + std::to_string(layer) + ".key";
}

std::string PastValueName(std::size_t layer) {
  return "past_key_values." + std::to_string(layer) + ".value";
}

TensorBinding Feed::Bind() const {
  TensorBinding binding;
  binding.reserve(3 + past_key_values.size() * 2);
  if (input_ids.IsOwned()) {
    binding.emplace_back("input_ids", &input_ids);
  }
  if (attention_mask.IsOwned()) {
    binding.emplace_back("attention_mask", &attention_mask);
  }
  if (position_ids.IsOwned()) {
    binding.emplace_back("position_ids", &position_ids);
  }
  for (std::size_t i = 0; i < past_key_values.size(); ++i) {
    const auto &entry = past_key_values[i];
    if (entry.key.IsOwned()) {
      binding.emplace_back(PastKeyName(i), &entry.key);
    }
    if (entry.value.IsOwned()) {
      binding.emplace_back(PastValueName(i), &entry.value);
    }
  }
  return binding;
}

std::size_t Feed::BoundCount() const {
  std::size_t n = 0;
  n += input_ids.IsOwned() ? 1 : 0;
  n += attention_mask.IsOwned() ? 1 : 0;
  n += position_ids.IsOwned() ? 1 : 0;
  for (const auto &entry : past_key_values) {
    n += entry.key.IsOwned() ? 1 : 0;
    n += entry.value.IsOwned() ? 1 : 0;
  }
  return n;
}

void Feed::ReleaseTransient() {
  ReleaseIfOwned(input_ids);
  ReleaseIfOwned(attention_mask);
  ReleaseIfOwned(position_ids);
}

void Feed::ReleaseDeviceCache() {
  for (auto &entry : past_key_values) {
    ReleaseIfDevice(entry.key);
    ReleaseIfDevice(entry.value);
  }
}

void Feed::Clear() {
  ReleaseTransient();
  for (auto &entry : past_key_values) {
    ReleaseIfOwned(entry.key);
    ReleaseIfOwned(entry.value);
  }
  past_key_values.clear();
}

} // namespace decodeflux
