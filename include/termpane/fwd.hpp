#pragma once

#include <string>

namespace termpane
{

// Session identifier. Always a canonical lowercase UUID string
// ("xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx").
using SessionId = std::string;

struct Point;
struct Rect;

class Logger;

class TerminalSession;
class SessionSurface;
class SessionFactory;
struct SessionOptions;
struct ShellConfig;

class TaskScheduler;

class SplitNode;
class SplitContainer;
class TabBarModel;
class PanelCoordinator;
struct PanelConfig;
struct DragGesture;
struct DropTarget;

}   // namespace termpane
