#include "kernel/core/print.hpp"
#include "drivers/serial/pl011/pl011.hpp"
#include "kernel/arch/aarch64/sysreg.hpp"

namespace
{
    void prefix(const char* module)
    {
        kprint::dec_u64(kprint::uptime_ms());
        kprint::puts(" [");
        kprint::puts(module);
        kprint::puts("] ");
    }
}

namespace kprint
{
    void putc(char c) { pl011::putc(c); }
    void puts(const char* s) { pl011::puts(s); }

    void hex_u64(u64 x)
    {
        static const char* H = "0123456789ABCDEF";
        puts("0x");
        for (int i = 60; i >= 0; i -= 4)
        {
            putc(H[(x >> i) & 0xF]);
        }
    }

    void dec_u64(u64 x)
    {
        char buf[20];
        int i = 0;

        do
        {
            buf[i++] = char('0' + (x % 10));
            x /= 10;
        } while (x > 0);

        while (i--) putc(buf[i]);
    }

    void log(const char* module, const char* msg)
    {
        prefix(module);
        puts(msg);
        putc('\n');
    }

    void log_hex(const char* module, const char* msg, u64 value)
    {
        prefix(module);
        puts(msg);
        hex_u64(value);
        putc('\n');
    }

    u64 uptime_ms()
    {
        u64 freq = arch::sysreg::read_cntfrq();
        if (freq == 0)
        {
            return 0;
        }

        u64 ticks = arch::sysreg::read_cntpct();
        return (ticks / freq) * 1000 + ((ticks % freq) * 1000) / freq;
    }
}
