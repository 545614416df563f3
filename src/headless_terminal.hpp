#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Input is a scripted byte string; every write is appended to output().
 */
#include "iterminal.hpp"
#include <string>
#include <utility>
#include <vector>

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal() = default;
  explicit HeadlessTerminal(std::string input) : input_(std::move(input)) {}

  bool read_byte(unsigned char& out) override {
    if (read_pos_ >= input_.size()) return false;
    out = static_cast<unsigned char>(input_[read_pos_++]);
    return true;
  }
  bool write(std::string_view bytes) override {
    if (fail_writes_) return false;
    output_.append(bytes.data(), bytes.size());
    return true;
  }
  void flush() override { flushes_.push_back(output_.size()); }

  void feed(std::string_view bytes) { input_.append(bytes.data(), bytes.size()); }
  void set_fail_writes(bool v) { fail_writes_ = v; }
  const std::string& output() const { return output_; }
  // output offsets recorded at each flush()
  const std::vector<size_t>& flushes() const { return flushes_; }
  size_t unread() const { return input_.size() - read_pos_; }
  void clear_output() { output_.clear(); flushes_.clear(); }

private:
  std::string input_;
  size_t read_pos_ = 0;
  std::string output_;
  std::vector<size_t> flushes_;
  bool fail_writes_ = false;
};
