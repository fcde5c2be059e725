#include <dyematch/scene/Rasterizer.hpp>

#include "log/TaggedLogger.hpp"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>

namespace DM::Scene {

namespace {

struct PendingRaster {
    std::mutex                                           mutex;
    std::condition_variable                              cv;
    std::optional<Expected<std::vector<std::uint8_t>>>   result;
};

} // namespace

auto rasterize_with_deadline(std::shared_ptr<Rasterizer> rasterizer, Scene scene, RasterizeOptions const& options)
        -> Expected<std::vector<std::uint8_t>> {
    if (!rasterizer) {
        return std::unexpected(Error{Error::Code::RasterizeFailed, "no rasterizer configured"});
    }

    auto pending = std::make_shared<PendingRaster>();
    std::thread worker([pending, rasterizer = std::move(rasterizer), scene = std::move(scene), options]() {
        ScopedThreadName const name{"Rasterize"};
        Expected<std::vector<std::uint8_t>> outcome = std::unexpected(Error{Error::Code::RasterizeFailed, "rasterizer produced nothing"});
        try {
            outcome = rasterizer->rasterize(scene, options);
        } catch (std::exception const& ex) {
            Error error{Error::Code::RasterizeFailed, "Failed to render image"};
            error.cause = ex.what();
            outcome     = std::unexpected(std::move(error));
        } catch (...) {
            Error error{Error::Code::RasterizeFailed, "Failed to render image"};
            error.cause = "unknown exception";
            outcome     = std::unexpected(std::move(error));
        }
        std::lock_guard<std::mutex> lock(pending->mutex);
        pending->result = std::move(outcome);
        pending->cv.notify_one();
    });
    worker.detach();

    std::unique_lock<std::mutex> lock(pending->mutex);
    if (!pending->cv.wait_for(lock, options.timeout, [&] { return pending->result.has_value(); })) {
        dm_log("rasterizer exceeded " + std::to_string(options.timeout.count()) + "ms", "Rasterize", "WARN");
        return std::unexpected(Error{Error::Code::RasterizeFailed, "Rendering timed out"});
    }
    return std::move(*pending->result);
}

} // namespace DM::Scene
