// @file ReadingAheadBuffer.cppm
// @brief 先読み機能を持つ入力バッファ。

module;
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

export module datecodec.serialization.reading_ahead_buffer;

export namespace datecodec::serialization {

/// @brief 先読みバッファ。末尾の先読み領域は'\0'（番兵）で埋められる。
class ReadingAheadBuffer {
public:
    /// @brief コンストラクタ。
    /// @param buffer 入力内容。
    /// @param aheadSize 先読みbyte数。
    explicit ReadingAheadBuffer(std::string&& buffer, std::size_t aheadSize)
        : buffer_(std::move(buffer)), validSize_(buffer_.size()), aheadSize_(aheadSize) {
        buffer_.resize(validSize_ + aheadSize_, '\0');
    }

    ReadingAheadBuffer(const ReadingAheadBuffer&) = delete;
    ReadingAheadBuffer& operator=(const ReadingAheadBuffer&) = delete;

    /// @brief 現在の読み取り位置を返す。
    std::size_t position() const { return pos_; }

    /// @brief 現在位置から offset 先の文字を返す。
    /// @note 有効データを越えた位置は'\0'。先読み領域も越える場合は'\0'を返す。
    char peekAhead(std::size_t offset) const {
        if (pos_ + offset >= buffer_.size()) {
            return '\0';
        }
        return buffer_[pos_ + offset];
    }

    /// @brief 指定文字数だけ読み進める。
    void consume(std::size_t count = 1) {
        if (pos_ + count > validSize_) {
            throw std::runtime_error("ReadingAheadBuffer: consume past end of input");
        }
        pos_ += count;
    }

private:
    std::string buffer_;      ///< 入力本体＋先読み領域。
    std::size_t validSize_;   ///< 有効データ長。
    std::size_t aheadSize_;   ///< 先読みbyte数。
    std::size_t pos_ = 0;     ///< 現在位置。
};

}  // namespace datecodec::serialization
