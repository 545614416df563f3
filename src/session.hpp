#pragma once
/*
 * Session
 *
 * Purpose: one viewing session; owns the text, the view model, the renderer
 *          and the input decoder, borrows the terminal and the logger.
 * Loop: query window size -> render -> read one key (blocking) -> apply,
 *       until the interrupt byte, end of input, or a terminal failure.
 */
#include <string>
#include <string_view>
#include "types.hpp"
#include "text_buffer.hpp"
#include "view_model.hpp"
#include "renderer.hpp"
#include "input.hpp"

class ITerminal;
class Logger;

enum class SessionEnd { Interrupted, EndOfInput, TerminalError };

std::string_view session_end_name(SessionEnd e);

class Session {
public:
  Session(TextBuffer buf, ITerminal& term, Logger& log);
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  SessionEnd run();
  // one refresh cycle: size query, render, single write
  bool refresh();
  void step(const KeyEvent& ev);

  const ViewModel& model() const { return model_; }
  Renderer& renderer() { return renderer_; }
  const std::string& error() const { return error_; }

private:
  TextBuffer buf_;
  ViewModel model_;
  Renderer renderer_;
  InputDecoder decoder_;
  ITerminal& term_;
  Logger& log_;
  std::string error_;
};
