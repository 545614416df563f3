#include "input.hpp"
#include "iterminal.hpp"
#include "config.hpp"

const InputDecoder::Transition InputDecoder::kTable[StateCount][ClassCount] = {
  //               ESC                     '['                   'O'                   digit                   '~'                     other
  /* Ground */     {{Esc, Advance},        {Ground, EmitChar},   {Ground, EmitChar},   {Ground, EmitChar},     {Ground, EmitChar},     {Ground, EmitChar}},
  /* Esc */        {{EscDiscard, Advance}, {Csi, Advance},       {Ss3, Advance},       {EscDiscard, Advance},  {EscDiscard, Advance},  {EscDiscard, Advance}},
  /* EscDiscard */ {{Ground, Drop},        {Ground, Drop},       {Ground, Drop},       {Ground, Drop},         {Ground, Drop},         {Ground, Drop}},
  /* Csi */        {{Ground, EmitCsiFinal},{Ground, EmitCsiFinal},{Ground, EmitCsiFinal},{CsiParam, StoreParam},{Ground, EmitCsiFinal},{Ground, EmitCsiFinal}},
  /* CsiParam */   {{Ground, Drop},        {Ground, Drop},       {Ground, Drop},       {Ground, Drop},         {Ground, EmitParam},    {Ground, Drop}},
  /* Ss3 */        {{Ground, EmitSs3Final},{Ground, EmitSs3Final},{Ground, EmitSs3Final},{Ground, EmitSs3Final},{Ground, EmitSs3Final},{Ground, EmitSs3Final}},
};

InputDecoder::ByteClass InputDecoder::classify(unsigned char b) {
  if (b == WV_ESC_BYTE) return ClsEsc;
  if (b == '[') return ClsBracket;
  if (b == 'O') return ClsLetterO;
  if (b >= '0' && b <= '9') return ClsDigit;
  if (b == '~') return ClsTilde;
  return ClsOther;
}

Key csi_final_key(unsigned char b) {
  switch (b) {
    case 'A': return Key::ArrowUp;
    case 'B': return Key::ArrowDown;
    case 'C': return Key::ArrowRight;
    case 'D': return Key::ArrowLeft;
    case 'H': return Key::Home;
    case 'F': return Key::End;
    default: return Key::None;
  }
}

Key ss3_final_key(unsigned char b) {
  switch (b) {
    case 'H': return Key::Home;
    case 'F': return Key::End;
    default: return Key::None;
  }
}

Key csi_param_key(unsigned char digit) {
  switch (digit) {
    case '1': case '7': return Key::Home;
    case '4': case '8': return Key::End;
    case '3': return Key::Delete;
    case '5': return Key::PageUp;
    case '6': return Key::PageDown;
    default: return Key::None;
  }
}

static InputDecoder::Status emit(Key k, KeyEvent& out) {
  if (k == Key::None) return InputDecoder::Status::Dropped;
  out = KeyEvent{k, 0};
  return InputDecoder::Status::Key;
}

InputDecoder::Status InputDecoder::feed(unsigned char b, KeyEvent& out) {
  const Transition& t = kTable[state_][classify(b)];
  state_ = t.next;
  switch (t.action) {
    case EmitChar:
      out = KeyEvent{Key::Char, b};
      return Status::Key;
    case Advance:
      return Status::Pending;
    case StoreParam:
      param_ = b;
      return Status::Pending;
    case EmitCsiFinal: return emit(csi_final_key(b), out);
    case EmitSs3Final: return emit(ss3_final_key(b), out);
    case EmitParam: return emit(csi_param_key(param_), out);
    case Drop: break;
  }
  return Status::Dropped;
}

InputDecoder::ReadResult InputDecoder::read_key(ITerminal& term, KeyEvent& out) {
  unsigned char b = 0;
  while (term.read_byte(b)) {
    switch (feed(b, out)) {
      case Status::Key: return ReadResult::Key;
      case Status::Dropped: return ReadResult::Unrecognized;
      case Status::Pending: break;
    }
  }
  // short read mid-sequence yields no key
  reset();
  return ReadResult::EndOfInput;
}

bool InputDecoder::idle() const { return state_ == Ground; }

void InputDecoder::reset() {
  state_ = Ground;
  param_ = 0;
}
