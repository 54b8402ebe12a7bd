///////////////////////////
///   IMPORTS SECTION   ///
///////////////////////////
#include "opencl_evaluator.hpp"
#include "constraints.hpp"
#include "interval_math.hpp"
#include <algorithm>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

///////////////////////////
///   ERROR  CHECKING   ///
///////////////////////////
static inline void checkError(cl_int err, const char* operation) {
    if (err != CL_SUCCESS) {
        std::stringstream ss;
        ss << "OpenCL error during " << operation << ": " << err;
        throw std::runtime_error(ss.str());
    }
}

///////////////////////////
///   RESOURCE HOLDERS  ///
///////////////////////////
/// Owns a device buffer; released when the holder leaves scope.
struct DeviceBuffer {
    cl_mem mem = nullptr;

    DeviceBuffer(cl_context context, cl_mem_flags flags, size_t size, const char* name) {
        cl_int err = CL_SUCCESS;
        mem = clCreateBuffer(context, flags, size, nullptr, &err);
        checkError(err, name);
    }
    ~DeviceBuffer() { if (mem) clReleaseMemObject(mem); }

    DeviceBuffer(const DeviceBuffer&) = delete;
    DeviceBuffer& operator=(const DeviceBuffer&) = delete;
};

/// Owns a kernel object; released when the holder leaves scope.
struct KernelHandle {
    cl_kernel kernel = nullptr;

    KernelHandle(cl_program program, const char* name) {
        cl_int err = CL_SUCCESS;
        kernel = clCreateKernel(program, name, &err);
        checkError(err, "creating kernel");
    }
    ~KernelHandle() { if (kernel) clReleaseKernel(kernel); }

    KernelHandle(const KernelHandle&) = delete;
    KernelHandle& operator=(const KernelHandle&) = delete;
};

///////////////////////////
///   OPENCL KERNELS    ///
///////////////////////////
static const char* OVERLAP_KERNEL_SRC = R"(
__kernel void busy_overlap(
    __global const long* chunkStarts,     // flat busy chunk starts
    __global const long* chunkEnds,       // flat busy chunk ends
    __global const int* chunkOffsets,     // size: numParticipants+1
    __global const long* windowStarts,    // size: numWindows
    __global const long* windowEnds,      // size: numWindows
    const int numParticipants,
    const int numWindows,
    __global uchar* overlapOut            // size: numParticipants*numWindows
) {
    int gid = get_global_id(0);
    if (gid >= numParticipants * numWindows) return;

    int p = gid / numWindows;
    int w = gid % numWindows;

    long ws = windowStarts[w];
    long we = windowEnds[w];

    uchar hit = 0;
    for (int c = chunkOffsets[p]; c < chunkOffsets[p + 1]; ++c) {
        // Half-open ranges: touching ends do not overlap.
        if (chunkStarts[c] < we && ws < chunkEnds[c]) {
            hit = 1;
            break;
        }
    }
    overlapOut[gid] = hit;
}
)";

///////////////////////////
///   CONTEXT  SECTION  ///
///////////////////////////
BusyOverlapOpenCLContext::BusyOverlapOpenCLContext() {
    cl_int err = CL_SUCCESS;

    cl_uint numPlatforms = 0;
    err = clGetPlatformIDs(0, nullptr, &numPlatforms);
    if (err != CL_SUCCESS || numPlatforms == 0)
        throw std::runtime_error("No OpenCL platforms found.");

    std::vector<cl_platform_id> platforms(numPlatforms);
    err = clGetPlatformIDs(numPlatforms, platforms.data(), nullptr);
    checkError(err, "getting platform IDs");
    platform = platforms[0];

    err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_GPU, 1, &device, nullptr);
    if (err != CL_SUCCESS) {
        std::cout << "No GPU found, trying CPU...\n";
        err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_CPU, 1, &device, nullptr);
        checkError(err, "getting device ID");
    }

    char name[256] = {0};
    clGetDeviceInfo(device, CL_DEVICE_NAME, sizeof(name), name, nullptr);
    std::cout << "Using OpenCL device: " << name << "\n";

    context = clCreateContext(nullptr, 1, &device, nullptr, nullptr, &err);
    checkError(err, "creating context");

    // Release what exists if the remaining setup fails.
    try {
#if CL_TARGET_OPENCL_VERSION >= 200
        cl_queue_properties props[] = { CL_QUEUE_PROPERTIES, 0, 0 };
        queue = clCreateCommandQueueWithProperties(context, device, props, &err);
#else
        queue = clCreateCommandQueue(context, device, 0, &err);
#endif
        checkError(err, "creating command queue");

        program = buildProgram(OVERLAP_KERNEL_SRC);
    } catch (const std::runtime_error&) {
        if (queue) clReleaseCommandQueue(queue);
        clReleaseContext(context);
        throw;
    }
}

BusyOverlapOpenCLContext::~BusyOverlapOpenCLContext() {
    if (queue)   clReleaseCommandQueue(queue);
    if (program) clReleaseProgram(program);
    if (context) clReleaseContext(context);
}

cl_program BusyOverlapOpenCLContext::buildProgram(const char* src) {
    cl_int err = CL_SUCCESS;
    size_t len = std::strlen(src);
    const char* srcs[1] = { src };
    size_t lens[1] = { len };

    cl_program prog = clCreateProgramWithSource(context, 1, srcs, lens, &err);
    checkError(err, "creating program from source");

    err = clBuildProgram(prog, 1, &device, nullptr, nullptr, nullptr);
    if (err != CL_SUCCESS) {
        size_t logSize = 0;
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, 0, nullptr, &logSize);
        std::vector<char> log(logSize);
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, logSize, log.data(), nullptr);
        std::cerr << "OpenCL build log:\n" << log.data() << "\n";
        clReleaseProgram(prog);
        throw std::runtime_error("Failed to build OpenCL program");
    }

    return prog;
}

///////////////////////////
///   OVERLAP  SECTION  ///
///////////////////////////
/**
 * @brief Upload the participants' gated busy chunks once, then run the kernel
 *        over the windows in batches of `batchSize`.
 */
void BusyOverlapOpenCLContext::fillOverlapTable(BusyOverlapTable& table,
                                                const std::vector<Participant>& participants,
                                                const BusySnapshot& busy,
                                                const SearchOptions& options,
                                                int batchSize) {
    const std::vector<TimeChunk>& windows = table.windows();
    int numParticipants = (int)participants.size();
    int numWindows = (int)windows.size();
    if (numParticipants == 0 || numWindows == 0) return;
    if (batchSize < 1) batchSize = 1;

    // Flatten busy chunks per participant (CSR layout).
    std::vector<cl_long> chunkStarts;
    std::vector<cl_long> chunkEnds;
    std::vector<cl_int> chunkOffsets;
    chunkOffsets.reserve(participants.size() + 1);
    chunkOffsets.push_back(0);
    for (const Participant& p : participants) {
        for (const TimeChunk& c : gatedBusyChunks(p, busyFor(busy, p.id), options)) {
            chunkStarts.push_back((cl_long)c.start);
            chunkEnds.push_back((cl_long)c.end);
        }
        chunkOffsets.push_back((cl_int)chunkStarts.size());
    }
    // Zero-sized buffers are invalid; keep one unused element.
    if (chunkStarts.empty()) {
        chunkStarts.push_back(0);
        chunkEnds.push_back(0);
    }

    cl_int err = CL_SUCCESS;
    size_t bufChunksSize = chunkStarts.size() * sizeof(cl_long);
    size_t bufOffsetsSize = chunkOffsets.size() * sizeof(cl_int);
    int maxBatch = std::min(batchSize, numWindows);
    size_t bufWindowsSize = (size_t)maxBatch * sizeof(cl_long);
    size_t bufOutSize = (size_t)numParticipants * (size_t)maxBatch * sizeof(cl_uchar);

    DeviceBuffer d_chunkStarts(context, CL_MEM_READ_ONLY, bufChunksSize, "creating chunkStarts buffer");
    DeviceBuffer d_chunkEnds(context, CL_MEM_READ_ONLY, bufChunksSize, "creating chunkEnds buffer");
    DeviceBuffer d_chunkOffsets(context, CL_MEM_READ_ONLY, bufOffsetsSize, "creating chunkOffsets buffer");
    DeviceBuffer d_windowStarts(context, CL_MEM_READ_ONLY, bufWindowsSize, "creating windowStarts buffer");
    DeviceBuffer d_windowEnds(context, CL_MEM_READ_ONLY, bufWindowsSize, "creating windowEnds buffer");
    DeviceBuffer d_overlap(context, CL_MEM_WRITE_ONLY, bufOutSize, "creating overlapOut buffer");

    err = clEnqueueWriteBuffer(queue, d_chunkStarts.mem, CL_TRUE, 0, bufChunksSize, chunkStarts.data(), 0, nullptr, nullptr);
    checkError(err, "writing chunkStarts");
    err = clEnqueueWriteBuffer(queue, d_chunkEnds.mem, CL_TRUE, 0, bufChunksSize, chunkEnds.data(), 0, nullptr, nullptr);
    checkError(err, "writing chunkEnds");
    err = clEnqueueWriteBuffer(queue, d_chunkOffsets.mem, CL_TRUE, 0, bufOffsetsSize, chunkOffsets.data(), 0, nullptr, nullptr);
    checkError(err, "writing chunkOffsets");

    KernelHandle overlapKernel(program, "busy_overlap");
    cl_kernel kernel = overlapKernel.kernel;

    std::vector<cl_long> windowStarts(maxBatch);
    std::vector<cl_long> windowEnds(maxBatch);
    std::vector<cl_uchar> overlap((size_t)numParticipants * (size_t)maxBatch);

    for (int first = 0; first < numWindows; first += maxBatch) {
        int count = std::min(maxBatch, numWindows - first);
        for (int w = 0; w < count; ++w) {
            windowStarts[w] = (cl_long)windows[first + w].start;
            windowEnds[w] = (cl_long)windows[first + w].end;
        }

        err = clEnqueueWriteBuffer(queue, d_windowStarts.mem, CL_TRUE, 0, count * sizeof(cl_long), windowStarts.data(), 0, nullptr, nullptr);
        checkError(err, "writing windowStarts");
        err = clEnqueueWriteBuffer(queue, d_windowEnds.mem, CL_TRUE, 0, count * sizeof(cl_long), windowEnds.data(), 0, nullptr, nullptr);
        checkError(err, "writing windowEnds");

        int arg = 0;
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_chunkStarts.mem); checkError(err, "arg chunkStarts");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_chunkEnds.mem); checkError(err, "arg chunkEnds");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_chunkOffsets.mem); checkError(err, "arg chunkOffsets");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_windowStarts.mem); checkError(err, "arg windowStarts");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_windowEnds.mem); checkError(err, "arg windowEnds");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &numParticipants); checkError(err, "arg numParticipants");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &count); checkError(err, "arg numWindows");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_overlap.mem); checkError(err, "arg overlapOut");

        size_t global = (size_t)numParticipants * (size_t)count;
        err = clEnqueueNDRangeKernel(queue, kernel, 1, nullptr, &global, nullptr, 0, nullptr, nullptr);
        checkError(err, "enqueuing busy_overlap");
        err = clFinish(queue);
        checkError(err, "finishing queue");

        err = clEnqueueReadBuffer(queue, d_overlap.mem, CL_TRUE, 0, global * sizeof(cl_uchar), overlap.data(), 0, nullptr, nullptr);
        checkError(err, "reading overlapOut");

        for (int p = 0; p < numParticipants; ++p) {
            for (int w = 0; w < count; ++w) {
                table.set((size_t)p, (size_t)(first + w), overlap[(size_t)p * count + w] != 0);
            }
        }
    }
}
