#pragma once

#include <ftxui/component/component.hpp>

class RangePicker;

// Create the FTXUI front end for `picker`: a trigger line that opens two
// side-by-side month panels. Gestures are forwarded to the picker and every
// frame is painted from its grids. `picker` must outlive the component.
ftxui::Component MakeRangePickerApp(RangePicker &picker);
