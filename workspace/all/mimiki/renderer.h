#ifndef RENDERER_H
#define RENDERER_H

#include <stdint.h>
#include <string>
#include <vector>

namespace Mimiki {

// ============================================
// Draw commands
// ============================================

enum class TextAlign {
	Left,	// x is the left edge
	Center, // x is the horizontal centre
};

struct DrawCommand {
	int x;
	int y;
	std::string text;
	bool selected;
	TextAlign align;
};

typedef std::vector<DrawCommand> DrawList;

// ============================================
// Navigation input
// ============================================

struct InputEvent {
	enum Type {
		Navigate, // delta -1 up, +1 down
		Select,
		Back,
		Quit,
	};

	Type type;
	int delta;
};

// ============================================
// Rendering/input collaborator
// ============================================

// Owns the display, fonts and gamepads. The menu only hands it text to draw.
// quit() gives the display away (e.g. to an emulator), init() takes it back.
class Renderer {
public:
	virtual ~Renderer() {}

	virtual bool init() = 0;
	virtual void quit() = 0;
	virtual bool isReady() const = 0;

	// Clears, draws every command in order, presents
	virtual void present(const DrawList& commands) = 0;

	// Next navigation event, false when the queue is empty
	virtual bool pollInput(InputEvent* event) = 0;

	virtual void delay(uint32_t ms) = 0;
};

} // namespace Mimiki

#endif // RENDERER_H
