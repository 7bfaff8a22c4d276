#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight enums and key codes (choices/steps/failures).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */

enum class TallyChoice { Increment, Decrement, Quit };
enum class RecoveryChoice { Yes, No, Quit };

enum class AppState { Init, Running, Quitting };

enum class CountStep { Changed, Overflow, Underflow };

enum class Failure { None, Io, InvalidData, Aborted };

static constexpr int KEY_CTRL_C = 'C' - 64;
static constexpr int KEY_CTRL_H = 'H' - 64;
static constexpr int KEY_DEL = 127;
// an escape sequence (arrow/function key); never mapped to a choice
static constexpr int KEY_SEQUENCE = 0x1000;
