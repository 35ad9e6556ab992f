#ifndef __TG_SESSION_MESSAGES__
#define __TG_SESSION_MESSAGES__

#include "Headers.hpp"

namespace tg {
/** @brief Keystrokes for the terminal. */
struct InputMessage {
  string data;
};

/**
 * @brief A new terminal geometry.  Either dimension may be missing or
 * nonsensical on the wire; `isValid()` decides whether it is applied.
 */
struct ResizeMessage {
  optional<int> cols;
  optional<int> rows;

  inline bool isValid() const {
    return cols && rows && *cols > 0 && *rows > 0 && *cols <= 65535 &&
           *rows <= 65535;
  }
};

/** @brief Ends the session for good, tmux session included. */
struct CloseSessionMessage {};

typedef variant<InputMessage, ResizeMessage, CloseSessionMessage>
    ClientMessage;

/** @brief Bytes produced by the terminal. */
struct OutputMessage {
  string data;
};

/** @brief A fatal condition; the connection closes right after. */
struct ErrorMessage {
  string message;
};

typedef variant<OutputMessage, ErrorMessage> ServerMessage;

/**
 * @brief Parses one client frame.
 * @return nullopt for a well-formed message whose type is unknown.
 * @throws std::runtime_error when the frame is not a JSON object or a known
 * message carries fields of the wrong type.
 */
optional<ClientMessage> parseClientMessage(const string& text);

/** @brief Serializes one server message as a compact JSON object. */
string serializeServerMessage(const ServerMessage& message);
}  // namespace tg

#endif  // __TG_SESSION_MESSAGES__
