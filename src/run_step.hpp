#pragma once
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/beast/core/error.hpp>

// Starts one asynchronous operation and drives the context until it completes.
// The stream's expiry bounds every step, so run() cannot block past the deadline.
// The context must carry no other work.
template <class Start>
boost::beast::error_code run_step(boost::asio::io_context& ioc, Start start) {
    boost::beast::error_code result = boost::asio::error::operation_aborted;
    start([&result](boost::beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}
