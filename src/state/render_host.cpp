#include "state/render_host.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace cstate {

StrandRenderHost::StrandRenderHost(boost::asio::io_context& ioc)
    : strand_(boost::asio::make_strand(ioc))
{}

boost::asio::awaitable<void> StrandRenderHost::invoke(Work work) {
    // co_spawn onto the strand and suspend the caller until it finishes;
    // use_awaitable rethrows the exception_ptr the work completed with.
    co_await boost::asio::co_spawn(strand_, std::move(work),
                                   boost::asio::use_awaitable);
}

} // namespace cstate
