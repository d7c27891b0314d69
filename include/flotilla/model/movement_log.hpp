#pragma once

#include <datapod/datapod.hpp>

#include "flotilla/types.hpp"

namespace flotilla {
    namespace model {

        /// Bounded FIFO of movement records backed by a fixed ring.
        ///
        /// Capacity is set once. When full, `append` overwrites the oldest slot, so the log
        /// always holds the `capacity()` most recent records. A zero-capacity log drops
        /// everything.
        class MovementLog {
          public:
            explicit MovementLog(dp::usize capacity) : capacity_(capacity) { slots_.assign(capacity, MovementRecord{}); }

            inline void append(const MovementRecord &record) {
                if (capacity_ == 0) {
                    return;
                }
                if (size_ < capacity_) {
                    slots_[(head_ + size_) % capacity_] = record;
                    ++size_;
                    return;
                }
                slots_[head_] = record;
                head_ = (head_ + 1) % capacity_;
            }

            /// Copy of the current contents, oldest first.
            inline dp::Vector<MovementRecord> snapshot() const {
                dp::Vector<MovementRecord> out;
                out.reserve(size_);
                for (dp::usize i = 0; i < size_; ++i) {
                    out.push_back(slots_[(head_ + i) % capacity_]);
                }
                return out;
            }

            inline const MovementRecord *latest() const {
                if (size_ == 0) {
                    return nullptr;
                }
                return &slots_[(head_ + size_ - 1) % capacity_];
            }

            inline dp::usize size() const { return size_; }
            inline dp::usize capacity() const { return capacity_; }
            inline bool empty() const { return size_ == 0; }

          private:
            dp::Vector<MovementRecord> slots_;
            dp::usize capacity_ = 0;
            dp::usize head_ = 0; // oldest record
            dp::usize size_ = 0;
        };

    } // namespace model
} // namespace flotilla
