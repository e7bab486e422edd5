/**
 * @file Parameter.hpp
 * @brief Atomically shared scalar read by the audio thread and written by the control thread.
 */

#ifndef PCMFLOW_PARAMETER_HPP
#define PCMFLOW_PARAMETER_HPP

#include <atomic>
#include <cstdint>
#include <memory>

namespace pcmflow {

/**
 * @brief Shared handle to one atomic scalar.
 *
 * Copies refer to the same cell, so a control-side copy can steer an effect
 * that has been moved into the audio graph. Loads and stores are lock-free
 * for the scalar types used here (float, bool, uint64_t).
 */
template<typename T>
class Parameter {
public:
    Parameter() : Parameter(T{}) {}

    explicit Parameter(T initial)
        : cell_(std::make_shared<std::atomic<T>>(initial))
    {}

    T load() const {
        return cell_->load(std::memory_order_acquire);
    }

    void store(T value) {
        cell_->store(value, std::memory_order_release);
    }

    T fetch_add(T delta) {
        return cell_->fetch_add(delta, std::memory_order_acq_rel);
    }

private:
    std::shared_ptr<std::atomic<T>> cell_;
};

using FloatParameter = Parameter<float>;
using FlagParameter = Parameter<bool>;
using CounterParameter = Parameter<uint64_t>;

} // namespace pcmflow

#endif // PCMFLOW_PARAMETER_HPP
