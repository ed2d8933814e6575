#ifndef SDL_RENDERER_H
#define SDL_RENDERER_H

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>
#include <string>

#include "renderer.h"

namespace Mimiki {

struct SdlRendererConfig {
	int width;
	int height;
	std::string fontPath;
	int fontSize;
	std::string backgroundPath; // optional, missing file is not an error
};

// KMS/DRM fullscreen window, TTF text, first game controller found.
// D-pad/arrow keys navigate, A/Enter selects, B/Escape goes back.
class SdlRenderer : public Renderer {
public:
	explicit SdlRenderer(const SdlRendererConfig& config);
	~SdlRenderer() override;

	bool init() override;
	void quit() override;
	bool isReady() const override { return m_renderer != nullptr; }

	void present(const DrawList& commands) override;
	bool pollInput(InputEvent* event) override;
	void delay(uint32_t ms) override;

private:
	void drawText(const DrawCommand& command);
	void openController();
	bool translate(const SDL_Event& sdlEvent, InputEvent* event);

	SdlRendererConfig m_config;
	SDL_Window* m_window = nullptr;
	SDL_Renderer* m_renderer = nullptr;
	SDL_GameController* m_gamepad = nullptr;
	SDL_Texture* m_background = nullptr;
	TTF_Font* m_font = nullptr;
};

} // namespace Mimiki

#endif // SDL_RENDERER_H
