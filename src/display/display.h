#pragma once
#include <string>
#include "ast/schedule_ast.h"

namespace hron::display {

// 规范文本：display(parse(display(x))) == display(x)
std::string display(const ast::ScheduleData& schedule);

std::string displayExpr(const ast::ScheduleExpr& expr);

// 1 -> "1st"，11 -> "11th"，22 -> "22nd"
std::string ordinalNumber(int n);

} // namespace hron::display
