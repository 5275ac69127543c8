// dgramipc Umbrella Header
//
// Include this single header to pull in the public API:
//   - Endpoints (Sender, Receiver) and their configuration (ReceiverConfig)
//   - The message unit (MessageBuffer, kMessageBufferSize) and addresses (UnixAddress)
//   - Read wait policies (WaitPolicy) and the abnormal poll error (UnexpectedPollEvent)
//
// Each re-exported header line is annotated with IWYU pragma: export so that
// include-cleaner treats symbols they provide as satisfied.
#pragma once

#include "dgramipc/log.hpp"                    // IWYU pragma: export
#include "dgramipc/message-buffer.hpp"         // IWYU pragma: export
#include "dgramipc/poll-events.hpp"            // IWYU pragma: export
#include "dgramipc/receiver-config.hpp"        // IWYU pragma: export
#include "dgramipc/receiver.hpp"               // IWYU pragma: export
#include "dgramipc/sender.hpp"                 // IWYU pragma: export
#include "dgramipc/unexpected-poll-event.hpp"  // IWYU pragma: export
#include "dgramipc/unix-address.hpp"           // IWYU pragma: export
#include "dgramipc/wait-policy.hpp"            // IWYU pragma: export
