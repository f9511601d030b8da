#ifndef HALT_HPP
#define HALT_HPP

// =============================================================================
// halt - pause, resume and stop a reader, writer or item source from another
// thread
// =============================================================================
//
//   halt::halter reader{source};
//   auto remote = reader.remote();
//   std::thread worker([&] { halt::copy(reader, sink); });
//   remote.pause();   // worker sleeps at its next read()
//   remote.resume();
//   remote.stop();    // read() reports end-of-stream, copy returns
//   worker.join();
//
// Foundation:
// - halt_state / atomic_halt_state: shared three-valued state plus wait
// - policies: lock and memory-order selection
// - concepts: ByteReader, ByteWriter, ItemSource and friends
//
// Wrappers and handles:
// - halter: gates every read/write/next on the shared state
// - remote: copyable controller handle
// - gate: worker-side check for loops that are not streams
// - range_source: iterator pairs as item sources
//
// =============================================================================

#include "halt/concepts.hpp"
#include "halt/policies.hpp"
#include "halt/status.hpp"
#include "halt/halt_state.hpp"
#include "halt/remote.hpp"
#include "halt/gate.hpp"
#include "halt/halter.hpp"
#include "halt/range_source.hpp"

#endif // HALT_HPP
