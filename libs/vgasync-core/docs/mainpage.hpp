/**
@file
@brief Main page documentation.
*/

/**
@mainpage vgasync

vgasync is a raster display timing generator written in C++20. It produces the active video, horizontal sync and
vertical sync signals of a display mode one pixel clock tick at a time.



@section usage Usage

`vgasync::DisplaySystem` ties a timing generator to its pixel clock and a signal monitor. You can make as many
instances of it as you want; they're all completely independent and free of global state.

The constructor runs the power-on sequence with the default SVGA 800x600 @ 60Hz preset: the generator is held in reset
for one tick, held disabled for one more tick, then enabled. Invoke `vgasync::DisplaySystem::PowerOn()` to run the
sequence again. The number of ticks spent in each step is configured in `vgasync::core::Configuration::powerOn`.

Use `vgasync::DisplaySystem::RunTicks(uint64)` or `vgasync::DisplaySystem::RunFrames(uint64)` to advance the clock. The
outputs of every tick are fed to the `vgasync::vga::SignalMonitor` returned by `vgasync::DisplaySystem::GetMonitor()`,
which measures the width of every high and low run and the period between rising edges of each signal.

You can configure several parameters through `vgasync::DisplaySystem::configuration`.



@subsection profiles Timing profiles

A `vgasync::vga::TimingProfile` describes a display mode as the widths of its visible area, front porch, sync pulse and
back porch on both axes, plus their totals. `vgasync::vga::kPresets` lists the built-in modes; select one by name with
`vgasync::core::Configuration::Video::preset` or look it up with `vgasync::vga::FindPreset`.

Custom profiles are applied with `vgasync::DisplaySystem::SetProfile`. Profiles are validated with
`vgasync::vga::ValidateProfile` first; depending on `vgasync::core::Configuration::Video::profileValidation`, profiles
that fail validation are either used with a warning or refused. `vgasync::vga::ParseModeline` converts an X11 modeline
into a profile.



@subsection generator Using the generator directly

`vgasync::vga::TimingGenerator` can be driven without the rest of the system. Invoke
`vgasync::vga::TimingGenerator::Tick` once per pixel clock tick with the control inputs sampled on that tick. Inputs
resolve in a fixed order: `resetActive` wins over `sync`, which wins over `enable`.

Outputs are registered: `hSync` and `vSync` are computed from the counter values entering the tick, so they lag the
counters by one tick. `active` is registered from the horizontal counter and gated on the current vertical counter.

Edge callbacks can be attached with `vgasync::vga::TimingGenerator::MapCallbacks`. They are invoked synchronously from
`Tick` whenever an emitted sync level changes or a new frame starts.



@subsection save_states Save states

`vgasync::DisplaySystem::SaveState` and `vgasync::DisplaySystem::LoadState` capture and restore the generator counters
and output latches. States are validated against the current profile before being loaded.



@section threading Thread safety

The library is not thread-safe. Every `vgasync::DisplaySystem` instance must be driven from a single thread. Observable
configuration values notify the system immediately when assigned, so they must be modified from the same thread.
*/
