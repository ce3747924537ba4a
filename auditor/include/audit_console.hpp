#pragma once

#include "audit_coordinator.hpp"
#include "audit_request.hpp"
#include <ostream>
#include <string>

// Line-oriented operator console. Plain lines fill the input buffer,
// lines starting with ':' are commands. Must only be driven from the
// interface thread.
class AuditConsole : public AuditListener {
public:
    AuditConsole(std::ostream &out, std::ostream &err);

    void attach(AuditCoordinator &coordinator) { m_coordinator = &coordinator; }

    void print_banner();
    void handle_line(const std::string &line);
    void request_quit() { m_quit = true; }

    bool quit_requested() const { return m_quit; }
    bool trigger_enabled() const { return m_trigger_enabled; }
    int rate() const { return m_rate_wpm; }
    const std::string &buffer() const { return m_buffer; }

    void on_run_started() override;
    void on_run_finished(const std::optional<SpeakError> &error) override;

private:
    void execute_audit();
    void set_rate(const std::string &arg);
    void print_help();
    void print_status(const char *status);

    std::ostream &m_out;
    std::ostream &m_err;
    AuditCoordinator *m_coordinator = nullptr;

    std::string m_buffer;
    int m_rate_wpm = kDefaultRateWpm;
    bool m_trigger_enabled = true;
    bool m_quit = false;
};
