#ifndef HOTKEYS_H
#define HOTKEYS_H

#include <stdint.h>
#include <functional>
#include <string>
#include <vector>

struct input_event;

namespace Mimiki {

// ============================================
// Input devices
// ============================================

enum class DeviceRole {
	Mode,	  // joypad cluster, BTN_MODE
	Power,	  // pwrkey
	GpioKeys, // volume keys and lid switch
};

const char* DeviceRole_name(DeviceRole role);

// Name fragment matched against EVIOCGNAME
const char* DeviceRole_fragment(DeviceRole role);

// Non-blocking raw input node. Move-only, closes on destruction.
class InputDevice {
public:
	InputDevice() {}
	// Takes ownership of an already open non-blocking fd
	InputDevice(int fd, DeviceRole role, std::string name);
	~InputDevice();

	InputDevice(InputDevice&& other) noexcept;
	InputDevice& operator=(InputDevice&& other) noexcept;
	InputDevice(const InputDevice&) = delete;
	InputDevice& operator=(const InputDevice&) = delete;

	// event* names under dir, event2 before event10
	static std::vector<std::string> nodes(const std::string& dir);
	// First event* node under dir whose name contains the role fragment
	static InputDevice find(const std::string& dir, DeviceRole role);

	bool isOpen() const { return m_fd >= 0; }
	int fd() const { return m_fd; }
	DeviceRole role() const { return m_role; }
	const std::string& name() const { return m_name; }

	enum ReadResult {
		Event,
		Empty,	 // nothing queued
		Failed, // device gone or unreadable
	};
	ReadResult read(struct input_event* ev);

	void close();

private:
	int m_fd = -1;
	DeviceRole m_role = DeviceRole::Mode;
	std::string m_name;
};

// ============================================
// Semantic events
// ============================================

struct HotkeyEvent {
	enum Type {
		ShutdownRequested,
		Suspended,		   // power short press or lid close
		WakeDebounced,	   // short press swallowed right after a wake
		BrightnessChanged, // value = new level in percent
		VolumeUp,
		VolumeDown,
	};

	Type type;
	int value;
};

// ============================================
// Side effects
// ============================================

class PowerActions {
public:
	virtual ~PowerActions() {}
	// Blocks until the system resumes
	virtual void suspend() = 0;
	virtual void setBrightness(int percent) = 0;
	// delta in percent, e.g. +5 / -5
	virtual void stepVolume(int delta) = 0;
};

// Writes the sleep state and backlight surfaces, steps the ALSA mixer
class SystemPowerActions : public PowerActions {
public:
	SystemPowerActions(std::string sleepStatePath, std::string backlightPath);

	void suspend() override;
	void setBrightness(int percent) override;
	void stepVolume(int delta) override;

private:
	std::string m_sleepStatePath;
	std::string m_backlightPath;
};

// ============================================
// Monitor
// ============================================

struct HotkeyConfig {
	uint32_t longPressMs = 1750;
	uint32_t wakeDebounceMs = 500;
	int brightnessMin = 4; // never fully dark
	int brightnessMax = 100;
	int brightnessStep = 16;
	int brightnessDefault = 52;
	int volumeStep = 5;
	bool backlightEnabled = true;
};

// Mutated only by the monitor's own event processing
struct ButtonTimers {
	uint64_t powerPressTime = 0;
	bool powerHeld = false;
	bool modeHeld = false;
	bool hasWoken = false;
	uint64_t lastWakeTime = 0;
	int brightness = 52;
	bool backlightEnabled = true;
	bool shutdownLatched = false;
};

class HotkeyMonitor {
public:
	typedef std::function<uint64_t()> Clock;

	// Milliseconds from CLOCK_MONOTONIC
	static uint64_t monotonicMillis();

	HotkeyMonitor(PowerActions& actions, const HotkeyConfig& config, Clock clock = monotonicMillis);
	~HotkeyMonitor();

	HotkeyMonitor(const HotkeyMonitor&) = delete;
	HotkeyMonitor& operator=(const HotkeyMonitor&) = delete;

	// Opens every role found under dir. False only if none was found.
	bool init(const std::string& dir);

	// Adds an already opened device, replacing one with the same role
	void attach(InputDevice device);

	// Drains all queued input without blocking
	std::vector<HotkeyEvent> poll();

	// Drops queued input and held state, e.g. after an emulator session
	void discardPending();

	// Closes all devices and resets timers. Safe to call repeatedly.
	void shutdown();

	bool shutdownRequested() const { return m_timers.shutdownLatched; }
	size_t deviceCount() const;
	bool hasRole(DeviceRole role) const;

	const ButtonTimers& timers() const { return m_timers; }
	int brightness() const { return m_timers.brightness; }
	void setBacklightEnabled(bool enabled) { m_timers.backlightEnabled = enabled; }

private:
	void handleEvent(const struct input_event& ev, std::vector<HotkeyEvent>& out);
	void handlePower(int value, std::vector<HotkeyEvent>& out);
	void handleVolume(int direction, std::vector<HotkeyEvent>& out);
	void suspend(std::vector<HotkeyEvent>& out);
	void checkLongPress(std::vector<HotkeyEvent>& out);
	void requestShutdown(std::vector<HotkeyEvent>& out);
	void resetTimers();

	PowerActions& m_actions;
	HotkeyConfig m_config;
	Clock m_clock;
	ButtonTimers m_timers;
	std::vector<InputDevice> m_devices;
};

} // namespace Mimiki

#endif // HOTKEYS_H
