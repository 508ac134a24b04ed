/**
 * @file ring_buffer.h
 * @brief 고정 용량 원형 버퍼
 *
 * 세션별 시간 이력(깜빡임 창, 최근 기하 샘플)을 보관.
 * 용량은 템플릿 인자로 타입에 고정되며 메모리 재할당 없음.
 */

#ifndef AFFECT_SDK_RING_BUFFER_H
#define AFFECT_SDK_RING_BUFFER_H

#include <array>
#include <cstddef>

namespace affect_sdk {

/**
 * @brief 고정 용량 원형 버퍼
 *
 * 가득 찬 상태에서 push 하면 가장 오래된 원소를 덮어씀 (FIFO).
 * 인덱스 0 이 가장 오래된 원소.
 *
 * @note 스레드 안전하지 않음 - 소유자(세션)가 동기화 책임
 */
template <typename T, std::size_t Capacity>
class RingBuffer {
    static_assert(Capacity > 0, "RingBuffer capacity must be positive");

public:
    RingBuffer() = default;

    /**
     * @brief 원소 추가
     * @param value 추가할 값
     */
    void push(const T& value) {
        data_[(head_ + size_) % Capacity] = value;
        if (size_ < Capacity) {
            ++size_;
        } else {
            head_ = (head_ + 1) % Capacity;
        }
    }

    /// 저장된 원소 수
    std::size_t size() const noexcept { return size_; }

    /// 고정 용량
    static constexpr std::size_t capacity() noexcept { return Capacity; }

    bool empty() const noexcept { return size_ == 0; }
    bool full() const noexcept { return size_ == Capacity; }

    /**
     * @brief 오래된 순서 기준 원소 접근
     * @param index 0 = 가장 오래된 원소 (index < size() 필수)
     */
    const T& operator[](std::size_t index) const {
        return data_[(head_ + index) % Capacity];
    }

    /// 가장 최근 원소 (비어 있지 않을 때만 호출)
    const T& back() const { return (*this)[size_ - 1]; }

    /**
     * @brief 조건을 만족하는 원소 개수
     */
    template <typename Predicate>
    std::size_t countIf(Predicate pred) const {
        std::size_t count = 0;
        for (std::size_t i = 0; i < size_; ++i) {
            if (pred((*this)[i])) {
                ++count;
            }
        }
        return count;
    }

    void clear() noexcept {
        head_ = 0;
        size_ = 0;
    }

private:
    std::array<T, Capacity> data_{};
    std::size_t head_ = 0;
    std::size_t size_ = 0;
};

} // namespace affect_sdk

#endif // AFFECT_SDK_RING_BUFFER_H
