#include "hotkeys.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <linux/input.h>
#include <sys/ioctl.h>
#include <time.h>
#include <unistd.h>
#include <utility>

#include "defines.h"
#include "log.h"
#include "process.h"
#include "sysfs.h"

namespace Mimiki {

const char* DeviceRole_name(DeviceRole role)
{
	switch (role) {
	case DeviceRole::Mode:
		return "mode";
	case DeviceRole::Power:
		return "power";
	case DeviceRole::GpioKeys:
		return "gpio-keys";
	}
	return "unknown";
}

const char* DeviceRole_fragment(DeviceRole role)
{
	switch (role) {
	case DeviceRole::Mode:
		return "joypad";
	case DeviceRole::Power:
		return "pwrkey";
	case DeviceRole::GpioKeys:
		return "gpio-keys";
	}
	return "";
}

///////////////////////////////////////
// InputDevice

InputDevice::InputDevice(int fd, DeviceRole role, std::string name)
	: m_fd(fd), m_role(role), m_name(std::move(name))
{
}

InputDevice::~InputDevice()
{
	close();
}

InputDevice::InputDevice(InputDevice&& other) noexcept
	: m_fd(other.m_fd), m_role(other.m_role), m_name(std::move(other.m_name))
{
	other.m_fd = -1;
}

InputDevice& InputDevice::operator=(InputDevice&& other) noexcept
{
	if (this != &other) {
		close();
		m_fd = other.m_fd;
		m_role = other.m_role;
		m_name = std::move(other.m_name);
		other.m_fd = -1;
	}
	return *this;
}

std::vector<std::string> InputDevice::nodes(const std::string& dir)
{
	std::vector<std::pair<int, std::string>> found;

	DIR* dh = opendir(dir.c_str());
	if (dh) {
		struct dirent* entry;
		while ((entry = readdir(dh)) != NULL) {
			if (strncmp(entry->d_name, "event", 5) == 0)
				found.push_back(std::make_pair(atoi(entry->d_name + 5), std::string(entry->d_name)));
		}
		closedir(dh);
	}
	std::sort(found.begin(), found.end());

	std::vector<std::string> names;
	for (const auto& node : found)
		names.push_back(node.second);
	return names;
}

InputDevice InputDevice::find(const std::string& dir, DeviceRole role)
{
	const char* fragment = DeviceRole_fragment(role);
	for (const std::string& node : nodes(dir)) {
		std::string path = dir + "/" + node;

		// CLOEXEC keeps the nodes out of emulator processes
		int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
		if (fd < 0)
			continue;

		char name[256] = "Unknown";
		if (ioctl(fd, EVIOCGNAME(sizeof(name)), name) < 0) {
			::close(fd);
			continue;
		}
		// the kernel truncates long names without a terminator
		name[sizeof(name) - 1] = '\0';

		if (strstr(name, fragment) != NULL) {
			LOG_info("Found input device: %s (%s)\n", path.c_str(), name);
			return InputDevice(fd, role, name);
		}
		::close(fd);
	}

	return InputDevice();
}

InputDevice::ReadResult InputDevice::read(struct input_event* ev)
{
	if (m_fd < 0)
		return Failed;

	for (;;) {
		ssize_t n = ::read(m_fd, ev, sizeof(*ev));
		if (n == (ssize_t)sizeof(*ev))
			return Event;
		if (n < 0 && errno == EINTR)
			continue;
		if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
			return Empty;
		// 0 is EOF on a pipe, short reads never happen on evdev
		return n == 0 ? Empty : Failed;
	}
}

void InputDevice::close()
{
	if (m_fd >= 0) {
		::close(m_fd);
		m_fd = -1;
	}
}

///////////////////////////////////////
// SystemPowerActions

SystemPowerActions::SystemPowerActions(std::string sleepStatePath, std::string backlightPath)
	: m_sleepStatePath(std::move(sleepStatePath)), m_backlightPath(std::move(backlightPath))
{
}

void SystemPowerActions::suspend()
{
	LOG_info("Suspending...\n");
	if (!Sysfs_write(m_sleepStatePath, "mem"))
		LOG_warn("Could not suspend via %s: %s\n", m_sleepStatePath.c_str(), strerror(errno));
}

void SystemPowerActions::setBrightness(int percent)
{
	int raw = percent * 255 / 100;
	if (!Sysfs_writeInt(m_backlightPath, raw))
		LOG_warn("Could not set brightness to %d: %s\n", raw, strerror(errno));
}

void SystemPowerActions::stepVolume(int delta)
{
	char step[16];
	snprintf(step, sizeof(step), "%d%%%c", delta < 0 ? -delta : delta, delta < 0 ? '-' : '+');

	ProcessResult result = Process_run(AMIXER_PATH, {"amixer", "-q", "-c", "0", "sset", "Master", step});
	if (!Process_succeeded(result))
		LOG_warn("Volume step %s failed\n", step);
}

///////////////////////////////////////
// HotkeyMonitor

uint64_t HotkeyMonitor::monotonicMillis()
{
	struct timespec now;
	clock_gettime(CLOCK_MONOTONIC, &now);
	return (uint64_t)now.tv_sec * 1000 + (uint64_t)now.tv_nsec / 1000000;
}

HotkeyMonitor::HotkeyMonitor(PowerActions& actions, const HotkeyConfig& config, Clock clock)
	: m_actions(actions), m_config(config), m_clock(std::move(clock))
{
	m_timers.brightness = std::min(std::max(config.brightnessDefault, config.brightnessMin), config.brightnessMax);
	m_timers.backlightEnabled = config.backlightEnabled;
}

HotkeyMonitor::~HotkeyMonitor()
{
	shutdown();
}

bool HotkeyMonitor::init(const std::string& dir)
{
	const DeviceRole roles[] = {DeviceRole::Mode, DeviceRole::Power, DeviceRole::GpioKeys};

	for (DeviceRole role : roles) {
		InputDevice device = InputDevice::find(dir, role);
		if (device.isOpen())
			attach(std::move(device));
		else
			LOG_warn("Could not find device '%s'\n", DeviceRole_fragment(role));
	}

	if (m_devices.empty()) {
		LOG_error("Failed to open any input devices\n");
		return false;
	}

	LOG_info("Monitoring %zu input device(s)\n", m_devices.size());
	return true;
}

void HotkeyMonitor::attach(InputDevice device)
{
	for (InputDevice& existing : m_devices) {
		if (existing.role() == device.role()) {
			existing = std::move(device);
			return;
		}
	}
	m_devices.push_back(std::move(device));
}

size_t HotkeyMonitor::deviceCount() const
{
	return m_devices.size();
}

bool HotkeyMonitor::hasRole(DeviceRole role) const
{
	for (const InputDevice& device : m_devices) {
		if (device.role() == role && device.isOpen())
			return true;
	}
	return false;
}

std::vector<HotkeyEvent> HotkeyMonitor::poll()
{
	std::vector<HotkeyEvent> events;

	for (InputDevice& device : m_devices) {
		struct input_event ev;
		InputDevice::ReadResult result;
		while ((result = device.read(&ev)) == InputDevice::Event)
			handleEvent(ev, events);

		if (result == InputDevice::Failed && device.isOpen()) {
			LOG_warn("Lost input device %s (%s)\n", device.name().c_str(), DeviceRole_name(device.role()));
			device.close();
		}
	}

	m_devices.erase(std::remove_if(m_devices.begin(), m_devices.end(),
								   [](const InputDevice& d) { return !d.isOpen(); }),
					m_devices.end());

	// no timer of our own, a held key is measured here
	checkLongPress(events);
	return events;
}

void HotkeyMonitor::discardPending()
{
	for (InputDevice& device : m_devices) {
		struct input_event ev;
		while (device.read(&ev) == InputDevice::Event) {
		}
	}
	m_timers.powerHeld = false;
	m_timers.modeHeld = false;
}

void HotkeyMonitor::shutdown()
{
	for (InputDevice& device : m_devices)
		device.close();
	m_devices.clear();
	resetTimers();
}

void HotkeyMonitor::resetTimers()
{
	m_timers.powerPressTime = 0;
	m_timers.powerHeld = false;
	m_timers.modeHeld = false;
	m_timers.hasWoken = false;
	m_timers.lastWakeTime = 0;
}

void HotkeyMonitor::handleEvent(const struct input_event& ev, std::vector<HotkeyEvent>& out)
{
	if (ev.type == EV_SW) {
		if (ev.code == SW_LID && ev.value == 1)
			suspend(out);
		return;
	}

	if (ev.type != EV_KEY)
		return;

	switch (ev.code) {
	case BTN_MODE:
		m_timers.modeHeld = (ev.value == 1 || ev.value == 2);
		break;

	case KEY_POWER:
		handlePower(ev.value, out);
		break;

	case KEY_VOLUMEUP:
		if (ev.value == 1)
			handleVolume(+1, out);
		break;

	case KEY_VOLUMEDOWN:
		if (ev.value == 1)
			handleVolume(-1, out);
		break;

	default:
		break;
	}
}

void HotkeyMonitor::handlePower(int value, std::vector<HotkeyEvent>& out)
{
	if (value == 1 && !m_timers.powerHeld) {
		m_timers.powerPressTime = m_clock();
		m_timers.powerHeld = true;
		return;
	}

	if (value != 0 || !m_timers.powerHeld)
		return;

	uint64_t now = m_clock();
	uint64_t held = now - m_timers.powerPressTime;
	m_timers.powerHeld = false;

	if (held >= m_config.longPressMs) {
		requestShutdown(out);
		return;
	}

	if (m_timers.hasWoken && now - m_timers.lastWakeTime < m_config.wakeDebounceMs) {
		LOG_debug("Ignoring power press %llums after wake\n", (unsigned long long)(now - m_timers.lastWakeTime));
		out.push_back({HotkeyEvent::WakeDebounced, 0});
		return;
	}

	suspend(out);
}

void HotkeyMonitor::handleVolume(int direction, std::vector<HotkeyEvent>& out)
{
	if (m_timers.modeHeld && m_timers.backlightEnabled) {
		int level = m_timers.brightness + direction * m_config.brightnessStep;
		level = std::min(std::max(level, m_config.brightnessMin), m_config.brightnessMax);
		if (level == m_timers.brightness)
			return;

		m_timers.brightness = level;
		m_actions.setBrightness(level);
		out.push_back({HotkeyEvent::BrightnessChanged, level});
		return;
	}

	m_actions.stepVolume(direction * m_config.volumeStep);
	out.push_back({direction > 0 ? HotkeyEvent::VolumeUp : HotkeyEvent::VolumeDown, m_config.volumeStep});
}

void HotkeyMonitor::suspend(std::vector<HotkeyEvent>& out)
{
	m_actions.suspend();
	// taken after resume, the write above returns on wake
	m_timers.lastWakeTime = m_clock();
	m_timers.hasWoken = true;
	out.push_back({HotkeyEvent::Suspended, 0});
}

void HotkeyMonitor::checkLongPress(std::vector<HotkeyEvent>& out)
{
	if (!m_timers.powerHeld)
		return;

	if (m_clock() - m_timers.powerPressTime >= m_config.longPressMs)
		requestShutdown(out);
}

void HotkeyMonitor::requestShutdown(std::vector<HotkeyEvent>& out)
{
	if (m_timers.shutdownLatched)
		return;

	LOG_info("Power held, shutdown requested\n");
	m_timers.shutdownLatched = true;
	out.push_back({HotkeyEvent::ShutdownRequested, 0});
}

} // namespace Mimiki
