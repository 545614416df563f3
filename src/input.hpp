#pragma once
#include <cstdint>
#include "types.hpp"
/*
 * Input
 *
 * Purpose: decode a byte stream into KeyEvents (arrows, paging, home/end,
 *          delete, plain bytes) with a table-driven escape-sequence machine.
 * Grammar: ESC b1 b2 [b3]; ESC is always followed by exactly two bytes,
 *          ESC [ <digit> takes a third which must be '~'.
 */

class ITerminal;

class InputDecoder {
public:
  enum class Status { Pending, Key, Dropped };
  enum class ReadResult { Key, Unrecognized, EndOfInput };

  // Feed one byte. Key: out holds the event. Dropped: sequence discarded.
  Status feed(unsigned char b, KeyEvent& out);
  // Blocking read of bytes until one event completes or the input ends.
  ReadResult read_key(ITerminal& term, KeyEvent& out);
  bool idle() const;
  void reset();

private:
  enum State : uint8_t { Ground, Esc, EscDiscard, Csi, CsiParam, Ss3, StateCount };
  enum ByteClass : uint8_t { ClsEsc, ClsBracket, ClsLetterO, ClsDigit, ClsTilde, ClsOther, ClassCount };
  enum Action : uint8_t { EmitChar, Advance, StoreParam, EmitCsiFinal, EmitSs3Final, EmitParam, Drop };
  struct Transition { State next; Action action; };

  static ByteClass classify(unsigned char b);
  static const Transition kTable[StateCount][ClassCount];

  State state_ = Ground;
  unsigned char param_ = 0;
};

Key csi_final_key(unsigned char b);
Key ss3_final_key(unsigned char b);
Key csi_param_key(unsigned char digit);
