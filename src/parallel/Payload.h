#ifndef PAYLOAD_20261019_H
#define PAYLOAD_20261019_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace redist {

/**
 * @brief Non-owning view of a flat, contiguous buffer
 *
 * Multi-dimensional arrays are passed by their contiguous storage; the shape is not part of the
 * view and must be restored by the receiver.
 */
template <typename T> struct BufferView {
    BufferView() : data(nullptr), size(0) {}
    BufferView(T const* data, std::size_t size) : data(data), size(size) {}
    BufferView(std::vector<T> const& buffer) : data(buffer.data()), size(buffer.size()) {}

    T const* data;
    std::size_t size;
};

/**
 * @brief One buffer per destination; buffers[i] goes to the i-th destination
 */
template <typename T> struct PerDestinationPayloads {
    PerDestinationPayloads() = default;
    PerDestinationPayloads(std::vector<BufferView<T>> buffers) : buffers(std::move(buffers)) {}
    PerDestinationPayloads(std::vector<std::vector<T>> const& data) {
        buffers.reserve(data.size());
        for (auto const& d : data) {
            buffers.emplace_back(d);
        }
    }

    std::vector<BufferView<T>> buffers;
};

/**
 * @brief The same buffer goes to every destination
 */
template <typename T> struct BroadcastPayload {
    BroadcastPayload() = default;
    BroadcastPayload(BufferView<T> buffer) : buffer(buffer) {}
    BroadcastPayload(std::vector<T> const& data) : buffer(data) {}

    BufferView<T> buffer;
};

template <typename T>
using Payload = std::variant<PerDestinationPayloads<T>, BroadcastPayload<T>>;

template <typename T> struct Transfer {
    int dest;
    BufferView<T> payload;
};

/**
 * @brief Pairs every destination with the buffer it receives
 *
 * @throws std::invalid_argument if a per-destination payload does not have exactly one buffer
 * per destination
 */
template <typename T>
std::vector<Transfer<T>> resolve_transfers(std::vector<int> const& destinations,
                                           Payload<T> const& payload) {
    std::vector<Transfer<T>> transfers;
    transfers.reserve(destinations.size());
    if (auto per_dest = std::get_if<PerDestinationPayloads<T>>(&payload)) {
        if (per_dest->buffers.size() != destinations.size()) {
            throw std::invalid_argument(
                "Got " + std::to_string(per_dest->buffers.size()) + " payloads for " +
                std::to_string(destinations.size()) + " destinations");
        }
        for (std::size_t i = 0; i < destinations.size(); ++i) {
            transfers.push_back({destinations[i], per_dest->buffers[i]});
        }
    } else {
        auto const& buffer = std::get<BroadcastPayload<T>>(payload).buffer;
        for (auto dest : destinations) {
            transfers.push_back({dest, buffer});
        }
    }
    return transfers;
}

} // namespace redist

#endif // PAYLOAD_20261019_H
