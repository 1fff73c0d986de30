#pragma once

#include <string>
#include <fmt/core.h>
#include <fmt/std.h>
#include <fstream>
#include <ostream>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace geo_kernel {
    /**
    * @enum LogLevel
    * @brief Representa os níveis de severidade de log.
    */
    enum class LogLevel {
        Info,
        Success,
        Warn,
        Error,
        Debug
    };

    /**
     * @class Debug
     * @brief Classe utilitária para logging com cores, níveis e saída configurável.
     *
     * - Em Debug: todos os níveis são exibidos por padrão.
     * - Em Release: apenas Warn e acima, ajustável via SetMinimumLevel().
     * - Suporte a cores ANSI (opcional), desligadas automaticamente ao escrever em arquivo.
     * - Thread-safe para uso em aplicações multithread.
     */
    class Debug {
    public:
        /// Ativa ou desativa cores ANSI.
        static void SetColorEnabled(bool enabled);

        /// Define o nível mínimo exibido nos logs.
        static void SetMinimumLevel(LogLevel level);

        static LogLevel GetMinimumLevel();

        /// Define se deve dar flush após cada log.
        static void SetAutoFlush(bool enabled);

        /// Define saída para arquivo (substitui stdout). Lança std::runtime_error se o arquivo não abrir.
        static void SetLogFile(const std::string& filepath);

        /// Redireciona a saída para um stream externo (não assume posse).
        static void SetOutputStream(std::ostream* stream);

        /// Reseta saída para console padrão.
        static void ResetOutputToConsole();

        /// Log genérico com formatação.
        template <typename... Args>
        static void Log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
            if (!IsEnabled(level)) return;

            const std::string msg = fmt::format(format, std::forward<Args>(args)...);
            Print(level, msg);
        }

        /// Registra o erro e lança std::runtime_error com a mesma mensagem.
        template <typename... Args>
        [[noreturn]] static void Throw(fmt::format_string<Args...> format, Args&&... args) {
            const std::string msg = fmt::format(format, std::forward<Args>(args)...);
            Print(LogLevel::Error, msg);
            throw std::runtime_error(msg);
        }

        /// Função interna para exibir mensagem com formatação final.
        static void Print(LogLevel level, const std::string& message);

    private:
        // Debug é o nível mais verboso, embora venha por último no enum.
        static bool IsEnabled(LogLevel level);

        static inline bool g_colorEnabled = true;
        static inline bool g_autoFlush = true;
        static inline LogLevel g_minLevel =
    #ifndef NDEBUG
            LogLevel::Info;
    #else
            LogLevel::Warn;
    #endif

        static inline std::ostream* g_outputStream = nullptr;
        static inline std::unique_ptr<std::ofstream> g_logFile;
        static inline std::mutex g_mutex;
    };
}

// ------------------- Macros para uso simplificado -------------------
#define GK_LOG_INFO(fmt_str, ...)    ::geo_kernel::Debug::Log(::geo_kernel::LogLevel::Info, fmt_str, ##__VA_ARGS__)
#define GK_LOG_SUCCESS(fmt_str, ...) ::geo_kernel::Debug::Log(::geo_kernel::LogLevel::Success, fmt_str, ##__VA_ARGS__)
#define GK_LOG_WARN(fmt_str, ...)    ::geo_kernel::Debug::Log(::geo_kernel::LogLevel::Warn, fmt_str, ##__VA_ARGS__)
#define GK_LOG_ERROR(fmt_str, ...)   ::geo_kernel::Debug::Log(::geo_kernel::LogLevel::Error, fmt_str, ##__VA_ARGS__)
#define GK_LOG_DEBUG(fmt_str, ...)   ::geo_kernel::Debug::Log(::geo_kernel::LogLevel::Debug, fmt_str, ##__VA_ARGS__)
#define GK_LOG_THROW(fmt_str, ...)   ::geo_kernel::Debug::Throw(fmt_str, ##__VA_ARGS__)
