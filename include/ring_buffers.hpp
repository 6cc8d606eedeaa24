//
// Created by Sanger Steel on 5/20/25.
//

#pragma once
#include <atomic>
#include <array>
#include <cstddef>
#include <optional>
#include <thread>

constexpr std::size_t LogRingBufferMaxSize = 65'536;
constexpr std::size_t SampleRingBufferMaxSize = 4'096;
constexpr std::size_t SnapshotRingBufferMaxSize = 64;

enum class SlotState {
    VACANT,
    WRITING,
    WRITTEN,
    READING,
};

enum class RingState {
    FULL,
    EMPTY,
    SUCCESS,
    NOT_READY,
};

struct PolledIdx {
    size_t polled_idx;
    size_t idx_in_buffer;
    size_t next_idx;
};

template<typename T>
struct RingResult {
    RingState state;
    std::optional<T> content;
    size_t slot_idx;

    RingResult(RingState state_, std::optional<T> content_, size_t idx)
    : state(state_), content(std::move(content_)), slot_idx(idx) {}
};

// A slot moves VACANT -> WRITING -> WRITTEN -> READING -> VACANT. Whoever claims
// the head or tail index owns the corresponding transition for that slot.
template <typename T>
class Slot {
public:
    bool try_claim(SlotState expected, SlotState new_state) {
        return state.compare_exchange_weak(expected, new_state, std::memory_order_acq_rel);
    }

    SlotState read_state() const {
        return state.load(std::memory_order_acquire);
    }

    void set(T&& to_set) {
        value = std::move(to_set);
        state.store(SlotState::WRITTEN, std::memory_order_release);
    }

    T take() {
        T out = std::move(value);
        value = T{};
        state.store(SlotState::VACANT, std::memory_order_release);
        return out;
    }

private:
    std::atomic<SlotState> state = SlotState::VACANT;
    T value{};
};

template <typename T, std::size_t N>
struct RingBuffer {
    static_assert(N > 1, "ring buffer needs at least two slots");

    virtual ~RingBuffer() = default;

    std::atomic<size_t> head = 0;
    std::atomic<size_t> tail = 0;

    std::array<Slot<T>, N> data;

    static constexpr size_t capacity() { return N - 1; }

    bool is_empty() const {
        return (tail.load(std::memory_order_acquire) == head.load(std::memory_order_acquire));
    }

    size_t size() const {
        return head.load(std::memory_order_acquire) - tail.load(std::memory_order_acquire);
    }

    std::optional<PolledIdx> try_claim_head() {
        while (true) {
            size_t t = this->tail.load(std::memory_order_acquire);
            size_t h = this->head.load(std::memory_order_acquire);
            if (h - t >= N - 1) {
                return std::nullopt;  // full
            }
            if (this->head.compare_exchange_weak(h, h + 1, std::memory_order_acq_rel)) {
                return PolledIdx{h, h % N, h + 1};
            }
        }
    }

    std::optional<PolledIdx> try_claim_tail() {
        while (true) {
            size_t t = this->tail.load(std::memory_order_acquire);
            size_t h = this->head.load(std::memory_order_acquire);
            if (t == h) {
                return std::nullopt;  // empty
            }
            if (this->tail.compare_exchange_weak(t, t + 1, std::memory_order_acq_rel)) {
                return PolledIdx{t, t % N, t + 1};
            }
        }
    }

    T receive_from_slot(PolledIdx tail_state) {
        auto& slot = data[tail_state.idx_in_buffer];
        while (!slot.try_claim(SlotState::WRITTEN, SlotState::READING)) {
            std::this_thread::yield();
        }
        return slot.take();
    }

    void send_to_slot(PolledIdx head_state, T&& content) {
        auto& slot = data[head_state.idx_in_buffer];
        while (!slot.try_claim(SlotState::VACANT, SlotState::WRITING)) {
            std::this_thread::yield();
        }
        slot.set(std::move(content));
    }
};

template<typename T, std::size_t N>
struct MPSCRingBuffer : RingBuffer<T, N> {

    ~MPSCRingBuffer() override = default;
    MPSCRingBuffer() = default;

    RingState push(T content);

    // Spins on FULL; use when dropping the value is not an option.
    void push_blocking(T content);

    RingResult<T> fetch();
};


template<typename T, std::size_t N>
RingState MPSCRingBuffer<T, N>::push(T content) {
    auto maybe_head = this->try_claim_head();
    if (!maybe_head.has_value()) {
        return RingState::FULL;
    }
    this->send_to_slot(maybe_head.value(), std::move(content));
    return RingState::SUCCESS;
}

template<typename T, std::size_t N>
void MPSCRingBuffer<T, N>::push_blocking(T content) {
    while (true) {
        auto maybe_head = this->try_claim_head();
        if (maybe_head.has_value()) {
            this->send_to_slot(maybe_head.value(), std::move(content));
            return;
        }
        std::this_thread::yield();
    }
}

template<typename T, std::size_t N>
RingResult<T> MPSCRingBuffer<T, N>::fetch() {
    auto maybe_tail = this->try_claim_tail();
    if (!maybe_tail.has_value()) {
        return RingResult<T>(RingState::EMPTY, std::nullopt, 0);
    }
    auto claimed_tail = maybe_tail.value();
    return RingResult<T>(RingState::SUCCESS, std::make_optional(this->receive_from_slot(claimed_tail)), claimed_tail.idx_in_buffer);
}
