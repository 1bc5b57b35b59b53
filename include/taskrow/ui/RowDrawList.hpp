#pragma once

#include <taskrow/ui/DrawCommands.hpp>

namespace TR::UI {

class SwipeableRow;

// Flattens the row's layers into draw commands in paint order. Hidden and
// fully transparent layers emit nothing; row alpha fades every command.
auto BuildRowDrawList(SwipeableRow const& row) -> Scene::DrawList;

} // namespace TR::UI
