#include "sdl_renderer.h"

#include <SDL2/SDL_image.h>

#include "log.h"

namespace Mimiki {

static const SDL_Color COLOR_TEXT = {255, 255, 255, 255};
static const SDL_Color COLOR_SELECTED = {100, 255, 100, 255};

SdlRenderer::SdlRenderer(const SdlRendererConfig& config)
	: m_config(config)
{
}

SdlRenderer::~SdlRenderer()
{
	quit();
}

bool SdlRenderer::init()
{
	if (isReady())
		return true;

	if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_GAMECONTROLLER) < 0) {
		LOG_error("SDL_Init failed: %s\n", SDL_GetError());
		return false;
	}

	m_window = SDL_CreateWindow("MIMIKI",
								SDL_WINDOWPOS_UNDEFINED, SDL_WINDOWPOS_UNDEFINED,
								m_config.width, m_config.height,
								SDL_WINDOW_FULLSCREEN);
	if (!m_window) {
		LOG_error("SDL_CreateWindow failed: %s\n", SDL_GetError());
		quit();
		return false;
	}

	m_renderer = SDL_CreateRenderer(m_window, -1, SDL_RENDERER_ACCELERATED);
	if (!m_renderer) {
		LOG_error("SDL_CreateRenderer failed: %s\n", SDL_GetError());
		quit();
		return false;
	}

	if (TTF_Init() < 0) {
		LOG_error("TTF_Init failed: %s\n", TTF_GetError());
		quit();
		return false;
	}

	m_font = TTF_OpenFont(m_config.fontPath.c_str(), m_config.fontSize);
	if (!m_font) {
		LOG_error("Failed to load %s: %s\n", m_config.fontPath.c_str(), TTF_GetError());
		quit();
		return false;
	}

	if (!m_config.backgroundPath.empty()) {
		if (!(IMG_Init(IMG_INIT_PNG) & IMG_INIT_PNG)) {
			LOG_warn("SDL_image init failed: %s\n", IMG_GetError());
		}
		else if (SDL_Surface* bg = IMG_Load(m_config.backgroundPath.c_str())) {
			m_background = SDL_CreateTextureFromSurface(m_renderer, bg);
			SDL_FreeSurface(bg);
		}
		else {
			LOG_debug("No background image: %s\n", IMG_GetError());
		}
	}

	openController();

	LOG_info("SDL2 initialized successfully (KMS/DRM backend)\n");
	return true;
}

void SdlRenderer::openController()
{
	for (int i = 0; i < SDL_NumJoysticks(); i++) {
		if (!SDL_IsGameController(i))
			continue;
		m_gamepad = SDL_GameControllerOpen(i);
		if (m_gamepad) {
			LOG_info("Gamepad opened: %s\n", SDL_GameControllerName(m_gamepad));
			return;
		}
	}
	LOG_warn("No gamepad found, keyboard only\n");
}

void SdlRenderer::quit()
{
	if (SDL_WasInit(SDL_INIT_VIDEO) == 0)
		return;

	if (m_font) {
		TTF_CloseFont(m_font);
		m_font = nullptr;
	}
	if (m_background) {
		SDL_DestroyTexture(m_background);
		m_background = nullptr;
	}
	if (m_gamepad) {
		SDL_GameControllerClose(m_gamepad);
		m_gamepad = nullptr;
	}
	if (m_renderer) {
		SDL_DestroyRenderer(m_renderer);
		m_renderer = nullptr;
	}
	if (m_window) {
		SDL_DestroyWindow(m_window);
		m_window = nullptr;
	}

	if (TTF_WasInit())
		TTF_Quit();
	IMG_Quit();
	SDL_Quit();
}

void SdlRenderer::present(const DrawList& commands)
{
	if (!m_renderer)
		return;

	SDL_SetRenderDrawColor(m_renderer, 0, 0, 0, 255);
	SDL_RenderClear(m_renderer);
	if (m_background)
		SDL_RenderCopy(m_renderer, m_background, NULL, NULL);

	for (const DrawCommand& command : commands)
		drawText(command);

	SDL_RenderPresent(m_renderer);
}

void SdlRenderer::drawText(const DrawCommand& command)
{
	if (command.text.empty() || !m_font)
		return;

	SDL_Color color = command.selected ? COLOR_SELECTED : COLOR_TEXT;
	SDL_Surface* text = TTF_RenderUTF8_Blended(m_font, command.text.c_str(), color);
	if (!text)
		return;

	SDL_Texture* texture = SDL_CreateTextureFromSurface(m_renderer, text);
	if (texture) {
		SDL_Rect target = {command.x, command.y, text->w, text->h};
		if (command.align == TextAlign::Center)
			target.x -= text->w / 2;
		SDL_RenderCopy(m_renderer, texture, NULL, &target);
		SDL_DestroyTexture(texture);
	}
	SDL_FreeSurface(text);
}

bool SdlRenderer::translate(const SDL_Event& sdlEvent, InputEvent* event)
{
	switch (sdlEvent.type) {
	case SDL_QUIT:
		*event = {InputEvent::Quit, 0};
		return true;

	case SDL_CONTROLLERDEVICEADDED:
		if (!m_gamepad)
			openController();
		return false;

	case SDL_CONTROLLERBUTTONDOWN:
		switch (sdlEvent.cbutton.button) {
		case SDL_CONTROLLER_BUTTON_DPAD_UP:
			*event = {InputEvent::Navigate, -1};
			return true;
		case SDL_CONTROLLER_BUTTON_DPAD_DOWN:
			*event = {InputEvent::Navigate, +1};
			return true;
		case SDL_CONTROLLER_BUTTON_A:
			*event = {InputEvent::Select, 0};
			return true;
		case SDL_CONTROLLER_BUTTON_B:
			*event = {InputEvent::Back, 0};
			return true;
		}
		return false;

	case SDL_KEYDOWN:
		switch (sdlEvent.key.keysym.sym) {
		case SDLK_UP:
			*event = {InputEvent::Navigate, -1};
			return true;
		case SDLK_DOWN:
			*event = {InputEvent::Navigate, +1};
			return true;
		case SDLK_RETURN:
			*event = {InputEvent::Select, 0};
			return true;
		case SDLK_ESCAPE:
		case SDLK_BACKSPACE:
			*event = {InputEvent::Back, 0};
			return true;
		}
		return false;
	}
	return false;
}

bool SdlRenderer::pollInput(InputEvent* event)
{
	if (!m_renderer)
		return false;

	SDL_Event sdlEvent;
	while (SDL_PollEvent(&sdlEvent)) {
		if (translate(sdlEvent, event))
			return true;
	}
	return false;
}

void SdlRenderer::delay(uint32_t ms)
{
	SDL_Delay(ms);
}

} // namespace Mimiki
