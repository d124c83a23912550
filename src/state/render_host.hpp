#pragma once

#include <functional>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

namespace cstate {

// ── RenderHost ───────────────────────────────────────────────────────────────
//
// The one primitive the state layer needs from the rendering engine: run a
// unit of work serialised with respect to all UI mutation.

class RenderHost {
public:
    using Work = std::function<boost::asio::awaitable<void>()>;

    virtual ~RenderHost() = default;

    // Runs `work` on the host's serialised context.  Completes when `work`
    // completes and rethrows anything it threw.
    [[nodiscard]] virtual boost::asio::awaitable<void> invoke(Work work) = 0;
};

// ── StrandRenderHost ─────────────────────────────────────────────────────────
//
// RenderHost backed by a Boost.Asio strand.  Anything that mutates component
// state must also run on strand() for the serialisation guarantee to hold.

class StrandRenderHost final : public RenderHost {
public:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    explicit StrandRenderHost(boost::asio::io_context& ioc);

    [[nodiscard]] boost::asio::awaitable<void> invoke(Work work) override;

    [[nodiscard]] const Strand& strand() const noexcept { return strand_; }

private:
    Strand strand_;
};

} // namespace cstate
