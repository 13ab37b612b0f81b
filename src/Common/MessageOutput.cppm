// @file MessageOutput.cppm
// @brief 警告メッセージの出力先を定義する。

module;
#include <iostream>
#include <mutex>
#include <string>

export module datecodec.common.message_output;

export namespace datecodec::common {

// @brief メッセージ出力用の基底クラス。
class MessageOutput {
public:
    virtual ~MessageOutput() = default;

    /// @brief 警告メッセージを出力する。
    /// @param msg 出力するメッセージ。
    virtual void warning(const std::string& msg) = 0;
};

// @brief 標準出力への警告出力
class StdoutMessageOutput : public MessageOutput {
public:
    /// @brief 警告メッセージを標準出力に出力する。
    /// @param msg 出力するメッセージ。
    /// @note 複数スレッドから呼ばれても行が混ざらないようにロックする。
    void warning(const std::string& msg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "Warning: " << msg << std::endl;
    }

private:
    std::mutex mutex_; ///< 出力の直列化用。
};

/// @brief 共有の標準出力用MessageOutputを取得する。
/// @return プロセス全体で共有されるインスタンス。
StdoutMessageOutput& getStdoutMessageOutput() {
    static StdoutMessageOutput output;
    return output;
}

}  // namespace datecodec::common
