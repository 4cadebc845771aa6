#pragma once

#include "generator/passphrasegenerator.h"
#include "generator/passwordgenerator.h"

#include <QCommandLineOption>
#include <QString>
#include <QStringList>

#include <optional>

class QCommandLineParser;
class QTextStream;

namespace PassforgeCli {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

enum class Mode : int
{
    Password = 0,
    Passphrase = 1,
};

struct Options final
{
    QCommandLineOption length{"length", "密码长度。", "n"};
    QCommandLineOption noLower{"no-lower", "不包含小写字母。"};
    QCommandLineOption noUpper{"no-upper", "不包含大写字母。"};
    QCommandLineOption digits{"digits", "数字个数。", "n"};
    QCommandLineOption symbols{"symbols", "符号个数。", "n"};
    QCommandLineOption symbolSet{"symbol-set", "自定义符号集合。", "chars"};
    QCommandLineOption allowAmbiguous{"allow-ambiguous", "允许易混淆字符（l/1/I/O/0）。"};
    QCommandLineOption words{"words", "口令短语的单词数量。", "n"};
    QCommandLineOption separator{"separator", "单词分隔符（可为空）。", "text"};
    QCommandLineOption noCapitalize{"no-capitalize", "单词首字母不大写。"};
    QCommandLineOption wordlist{"wordlist", "词表来源（URL 或本地文件）。", "source"};
    QCommandLineOption count{"count", "生成数量。", "n", "1"};
    QCommandLineOption strength{"strength", "在结果后输出强度估计。"};
    QCommandLineOption saveDefaults{"save-defaults", "把本次参数保存为默认值。"};
    QCommandLineOption verbose{"verbose", "输出调试日志到 stderr。"};

    void addTo(QCommandLineParser &parser) const;
};

std::optional<Mode> parseMode(const QStringList &positional, QString *errorOut = nullptr);

// Overlay the command line onto saved defaults. False (with a message) when an integer option is malformed.
bool applyPasswordOptions(const QCommandLineParser &parser, const Options &opts, PasswordRequest &request, QString *errorOut = nullptr);
bool applyPassphraseOptions(const QCommandLineParser &parser, const Options &opts, PassphraseRequest &request, QString *errorOut = nullptr);

int runPassword(const QCommandLineParser &parser, const Options &opts, int count, QTextStream &out, QTextStream &err);
// Blocks in a local event loop until the wordlist is ready or has failed.
int runPassphrase(const QCommandLineParser &parser, const Options &opts, int count, QTextStream &out, QTextStream &err);

// Dispatches an already parsed command line and returns the process exit code.
int run(const QCommandLineParser &parser, const Options &opts, QTextStream &out, QTextStream &err);

} // namespace PassforgeCli
