#ifndef RESOURCE_GUARD_HPP
#define RESOURCE_GUARD_HPP

namespace resource_guard
{
    // Memory backpressure for batch work, based on the process resident set size.
    class ResourceGuard
    {
    public:
        ResourceGuard(bool enabled, double limitMB);

        // Resident set size in MB, 0 when it cannot be read.
        double currentUsageMB() const;

        // Always false when disabled.
        bool overLimit() const;

        // Hands freed heap pages back to the kernel.
        void releaseMemory() const;

        bool enabled() const { return enabled_; }
        double limitMB() const { return limitMB_; }

    private:
        bool enabled_;
        double limitMB_;
    };
} // namespace resource_guard

#endif // RESOURCE_GUARD_HPP
