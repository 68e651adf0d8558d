#include "adapter_registration.hpp"

// type "none": configured but disabled, always clean
class NullScannerAdapter : public ScannerAdapter {
public:
    explicit NullScannerAdapter(const CustomScannerConfig&) {}
    std::string name() const override { return "none"; }
    ScanVerdict scan(const FileDescriptor&, const CancelToken&) override { return {}; }
};

REGISTER_SCANNER_ADAPTER(NullScannerAdapter, "none")
