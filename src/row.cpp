#include "row.hpp"
#include <algorithm>
#include <string>

Row::Row(int tab_stop) : tab_stop_(std::max(1, tab_stop)) {}

Row::Row(std::vector<Key> raw, int tab_stop) : raw_(std::move(raw)), tab_stop_(std::max(1, tab_stop)) {
  render();
}

void Row::set_tab_stop(int tab_stop) {
  tab_stop = std::max(1, tab_stop);
  if (tab_stop == tab_stop_) return;
  tab_stop_ = tab_stop;
  render();
}

void Row::render() {
  rendered_.clear();
  for (const auto& k : raw_) rendered_ += key_render(k, tab_stop_);
}

size_t Row::get_raw_index(size_t render_pos) const {
  size_t cur = 0;
  for (size_t i = 0; i < raw_.size(); ++i) {
    size_t w = width_of(raw_[i]);
    if (cur + w > render_pos) return i;
    cur += w;
  }
  return raw_.size();
}

std::pair<size_t, size_t> Row::get_render_index(size_t raw_idx) const {
  size_t start = 0;
  size_t n = std::min(raw_idx, raw_.size());
  for (size_t i = 0; i < n; ++i) start += width_of(raw_[i]);
  size_t w = raw_idx < raw_.size() ? width_of(raw_[raw_idx]) : 0;
  return {start, start + w};
}

bool Row::push(const Key& k) {
  std::u32string s = key_render(k, tab_stop_);
  if (s.empty()) return false;
  raw_.push_back(k);
  rendered_ += s;
  return true;
}

bool Row::insert(size_t at, const Key& k) {
  if (at >= rendered_.size()) return push(k);
  std::u32string s = key_render(k, tab_stop_);
  if (s.empty()) return false;
  size_t idx = get_raw_index(at);
  // `at` may sit inside a multi-column key; snap to that key's start
  size_t start = get_render_index(idx).first;
  raw_.insert(raw_.begin() + static_cast<long>(idx), k);
  rendered_.insert(start, s);
  return true;
}

size_t Row::backspace(size_t at) {
  if (raw_.empty() || at == 0) return 0;
  if (at >= rendered_.size()) {
    size_t w = width_of(raw_.back());
    raw_.pop_back();
    rendered_.resize(rendered_.size() - w);
    return w;
  }
  size_t idx = get_raw_index(at - 1);
  auto [start, end] = get_render_index(idx);
  rendered_.erase(start, end - start);
  raw_.erase(raw_.begin() + static_cast<long>(idx));
  return end - start;
}

Row Row::split(size_t at) {
  if (at >= rendered_.size()) return Row(tab_stop_);
  size_t idx = get_raw_index(at);
  std::vector<Key> tail(raw_.begin() + static_cast<long>(idx), raw_.end());
  raw_.erase(raw_.begin() + static_cast<long>(idx), raw_.end());
  rendered_.resize(get_render_index(idx).first);
  return Row(std::move(tail), tab_stop_);
}

void Row::append(const Row& other) {
  raw_.insert(raw_.end(), other.raw_.begin(), other.raw_.end());
  if (other.tab_stop_ == tab_stop_) rendered_ += other.rendered_;
  else render();
}

std::string Row::raw_text() const {
  std::string out;
  out.reserve(raw_.size());
  for (const auto& k : raw_) append_raw_text(k, out);
  return out;
}

size_t find_key_subsequence(std::span<const Key> hay, std::span<const Key> needle) {
  if (needle.empty() || needle.size() > hay.size()) return std::string::npos;
  auto it = std::search(hay.begin(), hay.end(), needle.begin(), needle.end());
  if (it == hay.end()) return std::string::npos;
  return static_cast<size_t>(it - hay.begin());
}
