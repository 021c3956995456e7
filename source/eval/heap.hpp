#pragma once

#include <utility>
#include <vector>

#include "object.hpp"

// Backing store for `@T` bindings. Cells are never reclaimed.
class heap final
{
  public:
    [[nodiscard]] auto allocate(object val) -> reference_value
    {
        m_cells.push_back(std::move(val));
        return reference_value {.cell = m_cells.size() - 1};
    }

    [[nodiscard]] auto get(reference_value ref) const -> const object& { return m_cells.at(ref.cell); }

    auto set(reference_value ref, object val) -> void { m_cells.at(ref.cell) = std::move(val); }

  private:
    std::vector<object> m_cells;
};
