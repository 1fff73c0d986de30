#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace geo_kernel {

    /**
     * @class Lazy
     * @brief Célula de valor calculado sob demanda, no máximo uma vez.
     *
     * - O supplier só é chamado no primeiro Get().
     * - Thread-safe: acessos concorrentes ao primeiro Get() executam o supplier uma única vez (std::call_once).
     * - Move-only; o estado vive no heap para que o once_flag não precise ser movido.
     */
    template<typename T>
    class Lazy {
    public:
        using Supplier = std::function<T()>;

        explicit Lazy(Supplier supplier)
            : m_cell(std::make_unique<Cell>()) {
            if (!supplier)
                throw std::invalid_argument("Lazy supplier is empty");
            m_cell->supplier = std::move(supplier);
        }

        Lazy(const Lazy&) = delete;
        Lazy& operator=(const Lazy&) = delete;
        Lazy(Lazy&&) noexcept = default;
        Lazy& operator=(Lazy&&) noexcept = default;

        const T& Get() const {
            std::call_once(m_cell->flag, [cell = m_cell.get()] {
                cell->value.emplace(cell->supplier());
                cell->supplier = nullptr;
                cell->computed.store(true, std::memory_order_release);
            });
            return *m_cell->value;
        }

        [[nodiscard]] bool IsComputed() const { return m_cell->computed.load(std::memory_order_acquire); }

    private:
        struct Cell {
            std::once_flag flag;
            std::optional<T> value;
            Supplier supplier;
            std::atomic_bool computed{ false };
        };

        std::unique_ptr<Cell> m_cell;
    };
} // namespace geo_kernel
