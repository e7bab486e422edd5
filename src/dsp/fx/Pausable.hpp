/**
 * @file Pausable.hpp
 * @brief Silences a source without advancing it.
 */

#ifndef PCMFLOW_PAUSABLE_HPP
#define PCMFLOW_PAUSABLE_HPP

#include "Source.hpp"
#include "Parameter.hpp"
#include <algorithm>
#include <stdexcept>

namespace pcmflow {

/**
 * @brief While the flag is set, emits full blocks of silence and leaves the inner source untouched.
 */
class Pausable : public Source {
public:
    Pausable(SourcePtr inner, FlagParameter paused)
        : inner_(std::move(inner))
        , paused_(std::move(paused))
    {
        if (!inner_) {
            throw std::invalid_argument("Pausable: inner source is null");
        }
    }

    StreamFormat format() const override { return inner_->format(); }

    FlagParameter paused() const { return paused_; }

protected:
    size_t do_pull(std::span<Sample> output) override {
        if (paused_.load()) {
            std::fill(output.begin(), output.end(), 0.0f);
            return output.size() / inner_->format().channels;
        }
        return inner_->pull(output);
    }

    std::optional<uint64_t> frames_left() const override {
        if (paused_.load()) {
            return std::nullopt;
        }
        return inner_->remaining_frames();
    }

private:
    SourcePtr inner_;
    FlagParameter paused_;
};

} // namespace pcmflow

#endif // PCMFLOW_PAUSABLE_HPP
