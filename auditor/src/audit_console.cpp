#include "audit_console.hpp"
#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace {
const char *STATUS_READY = "SYSTEM READY";
const char *STATUS_RUNNING = "AUDIT IN PROGRESS...";
}

AuditConsole::AuditConsole(std::ostream &out, std::ostream &err)
    : m_out(out), m_err(err) {}

void AuditConsole::print_banner() {
    m_out << "KAIROS PROJECT: AUDIO AUDITOR\n"
          << "FORENSIC INPUT BUFFER: type or paste text, :help for commands\n"
          << "AUDIT PLAYBACK RATE (WPM): " << m_rate_wpm << "\n";
    print_status(STATUS_READY);
}

void AuditConsole::handle_line(const std::string &line) {
    // "::" escapes a buffer line that itself starts with ':'
    if (line.empty() || line[0] != ':' || line.compare(0, 2, "::") == 0) {
        if (!m_buffer.empty())
            m_buffer += '\n';
        m_buffer += line.compare(0, 2, "::") == 0 ? line.substr(1) : line;
        return;
    }

    std::string command = line.substr(1);
    std::string arg;
    size_t space = command.find(' ');
    if (space != std::string::npos) {
        arg = command.substr(space + 1);
        command.erase(space);
    }

    if (command == "run") {
        execute_audit();
    } else if (command == "rate") {
        set_rate(arg);
    } else if (command == "clear") {
        m_buffer.clear();
        m_out << "Input buffer cleared.\n";
    } else if (command == "show") {
        m_out << "--- buffer (" << m_buffer.size() << " bytes, rate "
              << m_rate_wpm << " WPM) ---\n"
              << m_buffer << "\n---\n";
    } else if (command == "help") {
        print_help();
    } else if (command == "quit" || command == "exit") {
        m_quit = true;
    } else {
        m_err << "Unknown command :" << command << " (try :help)\n";
    }
}

void AuditConsole::execute_audit() {
    if (!m_trigger_enabled) {
        m_out << STATUS_RUNNING << "\n";
        return;
    }
    if (!m_coordinator) {
        m_err << "ERROR: No audit coordinator attached\n";
        return;
    }

    try {
        m_coordinator->submit(m_buffer, m_rate_wpm);
    } catch (const EmptyInputError &e) {
        m_err << "Logic Error: " << e.what() << "\n";
    } catch (const AuditError &e) {
        m_err << "Audit rejected: " << e.what() << "\n";
    } catch (const std::system_error &e) {
        m_err << "Audit rejected: " << e.what() << "\n";
    }
}

// Behaves like the bounded slider: out-of-range values snap to the ends.
void AuditConsole::set_rate(const std::string &arg) {
    int value;
    try {
        size_t used = 0;
        value = std::stoi(arg, &used);
        if (used != arg.size())
            throw std::invalid_argument(arg);
    } catch (const std::logic_error &) {
        m_err << "Usage: :rate <" << kMinRateWpm << "-" << kMaxRateWpm
              << ">\n";
        return;
    }

    m_rate_wpm = std::min(kMaxRateWpm, std::max(kMinRateWpm, value));
    m_out << "AUDIT PLAYBACK RATE (WPM): " << m_rate_wpm << "\n";
}

void AuditConsole::print_help() {
    m_out << "  :run        execute audit on the input buffer\n"
          << "  :rate N     set playback rate, " << kMinRateWpm << "-"
          << kMaxRateWpm << " WPM\n"
          << "  :clear      empty the input buffer\n"
          << "  :show       print the input buffer\n"
          << "  :quit       close the auditor\n"
          << "  ::text      add a line starting with ':'\n";
}

void AuditConsole::print_status(const char *status) {
    m_out << "[" << status << "]\n";
    m_out.flush();
}

void AuditConsole::on_run_started() {
    m_trigger_enabled = false;
    print_status(STATUS_RUNNING);
}

void AuditConsole::on_run_finished(const std::optional<SpeakError> &error) {
    if (error) {
        m_err << "Audit Exception: " << error->what() << "\n";
    }
    m_trigger_enabled = true;
    print_status(STATUS_READY);
}
