#pragma once
/*
 * Recovery prompt
 *
 * Purpose: ask before overwriting a counter file that holds non-counter data.
 * Keys: y/Y → Yes, n/N → No, q/Q/Ctrl-C → Quit.
 * Note: the terminal is back in normal mode when ask_overwrite returns,
 *       whatever the answer.
 */
#include <string>
#include "iterminal.hpp"
#include "key_map.hpp"
#include "types.hpp"

extern const char* const kRecoveryPrompt;

const KeyMap<RecoveryChoice>& recovery_keys();
bool ask_overwrite(ITerminal& term, RecoveryChoice& choice, std::string& msg);
