#include "vk_renderer.hpp"

#include <GLFW/glfw3.h>
#include <stdexcept>
#include <vector>
#include <array>
#include <optional>
#include <cstring>
#include <fstream>
#include <string>
#include <iostream>
#include <algorithm>

#include <imgui.h>
#include <imgui_impl_vulkan.h>

#include "../scene_math.hpp"
#include "../vertex.hpp"
#include "../../ui/gui_overlay.hpp"

#ifndef TRI_HARNESS_SHADER_DIR
#define TRI_HARNESS_SHADER_DIR "shaders"
#endif

// fence waits longer than this are reported as a skipped frame
static constexpr uint64_t FRAME_TIMEOUT_NS = 1'000'000'000ull;

namespace {

struct QueueFamilies {
    std::optional<uint32_t> graphics;
    std::optional<uint32_t> present;

    bool complete() const { return graphics && present; }
};

struct SurfaceSupport {
    VkSurfaceCapabilitiesKHR        caps{};
    std::vector<VkSurfaceFormatKHR> formats;
    std::vector<VkPresentModeKHR>   modes;

    bool usable() const { return !formats.empty() && !modes.empty(); }
};

std::vector<char> read_binary(const std::string& path)
{
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("cannot open " + path);

    std::vector<char> bytes(static_cast<size_t>(in.tellg()));
    in.seekg(0);
    in.read(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return bytes;
}

QueueFamilies find_families(VkPhysicalDevice gpu, VkSurfaceKHR surface)
{
    uint32_t n = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(gpu, &n, nullptr);
    std::vector<VkQueueFamilyProperties> props(n);
    vkGetPhysicalDeviceQueueFamilyProperties(gpu, &n, props.data());

    QueueFamilies out;
    for (uint32_t i = 0; i < n && !out.complete(); ++i) {
        if (props[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) out.graphics = i;

        VkBool32 can_present = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR(gpu, i, surface, &can_present);
        if (can_present) out.present = i;
    }
    return out;
}

SurfaceSupport query_support(VkPhysicalDevice gpu, VkSurfaceKHR surface)
{
    SurfaceSupport s;
    vkGetPhysicalDeviceSurfaceCapabilitiesKHR(gpu, surface, &s.caps);

    uint32_t n = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(gpu, surface, &n, nullptr);
    s.formats.resize(n);
    if (n) vkGetPhysicalDeviceSurfaceFormatsKHR(gpu, surface, &n, s.formats.data());

    n = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(gpu, surface, &n, nullptr);
    s.modes.resize(n);
    if (n) vkGetPhysicalDeviceSurfacePresentModesKHR(gpu, surface, &n, s.modes.data());
    return s;
}

bool has_swapchain_extension(VkPhysicalDevice gpu)
{
    uint32_t n = 0;
    vkEnumerateDeviceExtensionProperties(gpu, nullptr, &n, nullptr);
    std::vector<VkExtensionProperties> exts(n);
    vkEnumerateDeviceExtensionProperties(gpu, nullptr, &n, exts.data());

    return std::any_of(exts.begin(), exts.end(), [](const VkExtensionProperties& e) {
        return std::strcmp(e.extensionName, VK_KHR_SWAPCHAIN_EXTENSION_NAME) == 0;
    });
}

// ImGui blends in gamma space, so a UNORM target is preferred unless the
// caps ask for sRGB.
VkSurfaceFormatKHR pick_format(const std::vector<VkSurfaceFormatKHR>& formats, bool prefer_srgb)
{
    const VkFormat order[] = {
        prefer_srgb ? VK_FORMAT_B8G8R8A8_SRGB : VK_FORMAT_B8G8R8A8_UNORM,
        prefer_srgb ? VK_FORMAT_R8G8B8A8_SRGB : VK_FORMAT_R8G8B8A8_UNORM,
    };
    for (VkFormat want : order) {
        auto it = std::find_if(formats.begin(), formats.end(), [want](const VkSurfaceFormatKHR& f) {
            return f.format == want && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
        });
        if (it != formats.end()) return *it;
    }
    return formats.front();
}

bool from_vk(VkPresentModeKHR m, PresentMode& out)
{
    switch (m) {
    case VK_PRESENT_MODE_FIFO_KHR:         out = PresentMode::Fifo;        return true;
    case VK_PRESENT_MODE_FIFO_RELAXED_KHR: out = PresentMode::FifoRelaxed; return true;
    case VK_PRESENT_MODE_MAILBOX_KHR:      out = PresentMode::Mailbox;     return true;
    case VK_PRESENT_MODE_IMMEDIATE_KHR:    out = PresentMode::Immediate;   return true;
    default: return false;
    }
}

VkPresentModeKHR to_vk(PresentMode m)
{
    switch (m) {
    case PresentMode::Fifo:        return VK_PRESENT_MODE_FIFO_KHR;
    case PresentMode::FifoRelaxed: return VK_PRESENT_MODE_FIFO_RELAXED_KHR;
    case PresentMode::Mailbox:     return VK_PRESENT_MODE_MAILBOX_KHR;
    case PresentMode::Immediate:   return VK_PRESENT_MODE_IMMEDIATE_KHR;
    }
    return VK_PRESENT_MODE_FIFO_KHR;
}

VkPresentModeKHR pick_present_mode(const std::vector<VkPresentModeKHR>& modes, bool vsync)
{
    std::vector<PresentMode> supported;
    for (VkPresentModeKHR m : modes) {
        PresentMode pm;
        if (from_vk(m, pm)) supported.push_back(pm);
    }
    return to_vk(choose_present_mode(vsync, supported));
}

// a currentExtent of UINT32_MAX means the surface follows the swapchain size
VkExtent2D pick_extent(const VkSurfaceCapabilitiesKHR& caps, Extent2D wanted)
{
    if (caps.currentExtent.width != UINT32_MAX) return caps.currentExtent;
    return {std::clamp(wanted.width,  caps.minImageExtent.width,  caps.maxImageExtent.width),
            std::clamp(wanted.height, caps.minImageExtent.height, caps.maxImageExtent.height)};
}

const char* format_name(VkFormat f)
{
    switch (f) {
    case VK_FORMAT_B8G8R8A8_UNORM: return "B8G8R8A8_UNORM";
    case VK_FORMAT_R8G8B8A8_UNORM: return "R8G8B8A8_UNORM";
    case VK_FORMAT_B8G8R8A8_SRGB:  return "B8G8R8A8_SRGB";
    case VK_FORMAT_R8G8B8A8_SRGB:  return "R8G8B8A8_SRGB";
    case VK_FORMAT_A2B10G10R10_UNORM_PACK32: return "A2B10G10R10_UNORM";
    default: return "other";
    }
}

void report_imgui_vk_result(VkResult err)
{
    if (err != VK_SUCCESS) {
        std::cerr << "[VK] imgui_impl_vulkan: VkResult = " << static_cast<int>(err) << "\n";
    }
}

std::string vk_error(const char* what, VkResult r)
{
    return std::string(what) + " failed, VkResult = " + std::to_string(static_cast<int>(r));
}

template <typename Handle, typename Destroy>
void release(VkDevice device, Handle& h, Destroy destroy)
{
    if (h != VK_NULL_HANDLE) {
        destroy(device, h, nullptr);
        h = VK_NULL_HANDLE;
    }
}

} // namespace

// =================== lifecycle ===================

VulkanRenderer::~VulkanRenderer()
{
    shutdown();
}

Result<SurfaceInfo> VulkanRenderer::initialize(const NativeSurfaceHandle& target,
                                               const SurfaceRequest& request)
{
    window_         = static_cast<GLFWwindow*>(target.window);
    requested_size_ = request.size;
    vsync_          = request.vsync;
    caps_           = request.caps;
    std::copy(request.clear_color, request.clear_color + 4, clear_color_);

    if (!window_) {
        return Result<SurfaceInfo>::failure(ErrorKind::SurfaceConfigurationError,
                                            "no GLFW window to bind the surface to");
    }

    auto fail = [this](ErrorKind kind, const std::string& msg) {
        shutdown();
        return Result<SurfaceInfo>::failure(kind, msg);
    };

    try {
        Status dev = create_device();
        if (!dev.ok) return fail(dev.err.kind, dev.err.message);

        if (!create_swapchain_objects() || !create_render_pass() || !create_framebuffers())
            return fail(ErrorKind::SurfaceConfigurationError, "swapchain creation failed");

        if (!create_pipeline() || !create_frame_resources() || !create_triangle_buffers())
            return fail(ErrorKind::BackendUnavailable, "pipeline or resource creation failed");

        if (!init_imgui())
            return fail(ErrorKind::BackendUnavailable, "imgui_impl_vulkan initialization failed");
    } catch (const std::runtime_error& e) {
        return fail(ErrorKind::BackendUnavailable, e.what());
    }

    return Result<SurfaceInfo>::success(describe_surface());
}

SurfaceInfo VulkanRenderer::describe_surface() const
{
    SurfaceInfo info;
    info.size   = {extent_.width, extent_.height};
    info.format = format_name(color_format_);
    from_vk(present_mode_, info.present_mode);

    VkPhysicalDeviceProperties props{};
    vkGetPhysicalDeviceProperties(gpu_, &props);
    info.adapter = props.deviceName;
    return info;
}

void VulkanRenderer::wait_idle()
{
    if (device_) vkDeviceWaitIdle(device_);
}

void VulkanRenderer::shutdown()
{
    if (device_ != VK_NULL_HANDLE) {
        vkDeviceWaitIdle(device_);

        shutdown_imgui();
        destroy_buffer(vertices_);
        destroy_buffer(indices_);
        destroy_frame_resources();
        destroy_swapchain_objects();

        release(device_, pipeline_,        vkDestroyPipeline);
        release(device_, pipeline_layout_, vkDestroyPipelineLayout);
        release(device_, set_layout_,      vkDestroyDescriptorSetLayout);
        release(device_, render_pass_,     vkDestroyRenderPass);

        vkDestroyDevice(device_, nullptr);
        device_ = VK_NULL_HANDLE;
    }

    if (surface_ != VK_NULL_HANDLE) {
        vkDestroySurfaceKHR(instance_, surface_, nullptr);
        surface_ = VK_NULL_HANDLE;
    }
    if (instance_ != VK_NULL_HANDLE) {
        vkDestroyInstance(instance_, nullptr);
        instance_ = VK_NULL_HANDLE;
    }

    gpu_           = VK_NULL_HANDLE;
    color_format_  = VK_FORMAT_UNDEFINED;
    current_frame_ = 0;
}

// =================== device ===================

// Instance, surface, GPU and logical device. The error kind tells the caller
// whether Vulkan is missing altogether or just no adapter fits.
Status VulkanRenderer::create_device()
{
    VkApplicationInfo app{};
    app.sType              = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    app.pApplicationName   = "tri_harness";
    app.applicationVersion = VK_MAKE_VERSION(1, 0, 0);
    app.apiVersion         = VK_API_VERSION_1_1;

    uint32_t ext_count = 0;
    const char** exts = glfwGetRequiredInstanceExtensions(&ext_count);
    if (!exts) {
        return Status::failure(ErrorKind::BackendUnavailable, "GLFW reports no Vulkan surface extensions");
    }

    VkInstanceCreateInfo inst_info{};
    inst_info.sType                   = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    inst_info.pApplicationInfo        = &app;
    inst_info.enabledExtensionCount   = ext_count;
    inst_info.ppEnabledExtensionNames = exts;

    if (VkResult r = vkCreateInstance(&inst_info, nullptr, &instance_); r != VK_SUCCESS) {
        return Status::failure(ErrorKind::BackendUnavailable,
                               vk_error("vkCreateInstance (Vulkan loader or driver missing)", r));
    }

    if (!create_surface()) {
        return Status::failure(ErrorKind::SurfaceConfigurationError, "glfwCreateWindowSurface failed");
    }

    uint32_t gpu_count = 0;
    vkEnumeratePhysicalDevices(instance_, &gpu_count, nullptr);
    std::vector<VkPhysicalDevice> gpus(gpu_count);
    vkEnumeratePhysicalDevices(instance_, &gpu_count, gpus.data());

    QueueFamilies families;
    for (VkPhysicalDevice candidate : gpus) {
        QueueFamilies f = find_families(candidate, surface_);
        if (f.complete() && has_swapchain_extension(candidate) &&
            query_support(candidate, surface_).usable()) {
            gpu_ = candidate;
            families = f;
            break;
        }
    }
    if (gpu_ == VK_NULL_HANDLE) {
        return Status::failure(ErrorKind::NoSuitableAdapter,
                               "no GPU with graphics, present and swapchain support");
    }
    graphics_family_ = *families.graphics;
    present_family_  = *families.present;

    const float priority = 1.0f;
    std::vector<VkDeviceQueueCreateInfo> queues;
    for (uint32_t family : {graphics_family_, present_family_}) {
        if (!queues.empty() && queues.front().queueFamilyIndex == family) continue;
        VkDeviceQueueCreateInfo q{};
        q.sType            = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        q.queueFamilyIndex = family;
        q.queueCount       = 1;
        q.pQueuePriorities = &priority;
        queues.push_back(q);
    }

    const char* device_exts[] = { VK_KHR_SWAPCHAIN_EXTENSION_NAME };
    VkPhysicalDeviceFeatures features{};

    VkDeviceCreateInfo dev_info{};
    dev_info.sType                   = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    dev_info.queueCreateInfoCount    = static_cast<uint32_t>(queues.size());
    dev_info.pQueueCreateInfos       = queues.data();
    dev_info.pEnabledFeatures        = &features;
    dev_info.enabledExtensionCount   = 1;
    dev_info.ppEnabledExtensionNames = device_exts;

    if (VkResult r = vkCreateDevice(gpu_, &dev_info, nullptr, &device_); r != VK_SUCCESS) {
        return Status::failure(ErrorKind::NoSuitableAdapter, vk_error("vkCreateDevice", r));
    }

    vkGetDeviceQueue(device_, graphics_family_, 0, &graphics_queue_);
    vkGetDeviceQueue(device_, present_family_, 0, &present_queue_);
    return Status::success();
}

bool VulkanRenderer::create_surface()
{
    if (glfwCreateWindowSurface(instance_, window_, nullptr, &surface_) != VK_SUCCESS) {
        std::cerr << "[VK] Failed to create window surface\n";
        return false;
    }
    surface_lost_ = false;
    return true;
}

// =================== small builders ===================

VkImageView VulkanRenderer::make_image_view(VkImage image, VkFormat format, VkImageAspectFlags aspect)
{
    VkImageViewCreateInfo info{};
    info.sType                       = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    info.image                       = image;
    info.viewType                    = VK_IMAGE_VIEW_TYPE_2D;
    info.format                      = format;
    info.subresourceRange.aspectMask = aspect;
    info.subresourceRange.levelCount = 1;
    info.subresourceRange.layerCount = 1;

    VkImageView view = VK_NULL_HANDLE;
    if (vkCreateImageView(device_, &info, nullptr, &view) != VK_SUCCESS) {
        std::cerr << "[VK] Failed to create image view (" << format_name(format) << ")\n";
        return VK_NULL_HANDLE;
    }
    return view;
}

VkDeviceMemory VulkanRenderer::allocate_memory(const VkMemoryRequirements& req, VkMemoryPropertyFlags props)
{
    VkPhysicalDeviceMemoryProperties mem{};
    vkGetPhysicalDeviceMemoryProperties(gpu_, &mem);

    uint32_t type = mem.memoryTypeCount;
    for (uint32_t i = 0; i < mem.memoryTypeCount; ++i) {
        if ((req.memoryTypeBits & (1u << i)) && (mem.memoryTypes[i].propertyFlags & props) == props) {
            type = i;
            break;
        }
    }
    if (type == mem.memoryTypeCount) {
        throw std::runtime_error("no memory type with the requested properties");
    }

    VkMemoryAllocateInfo info{};
    info.sType           = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    info.allocationSize  = req.size;
    info.memoryTypeIndex = type;

    VkDeviceMemory out = VK_NULL_HANDLE;
    if (vkAllocateMemory(device_, &info, nullptr, &out) != VK_SUCCESS) return VK_NULL_HANDLE;
    return out;
}

// host visible and coherent, the triangle and its uniforms are tiny
bool VulkanRenderer::make_host_buffer(VkDeviceSize size, VkBufferUsageFlags usage, GpuBuffer& out)
{
    VkBufferCreateInfo info{};
    info.sType       = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    info.size        = size;
    info.usage       = usage;
    info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    if (vkCreateBuffer(device_, &info, nullptr, &out.buffer) != VK_SUCCESS) return false;

    VkMemoryRequirements req{};
    vkGetBufferMemoryRequirements(device_, out.buffer, &req);
    out.memory = allocate_memory(req, VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT);
    if (out.memory == VK_NULL_HANDLE) return false;

    return vkBindBufferMemory(device_, out.buffer, out.memory, 0) == VK_SUCCESS;
}

void VulkanRenderer::destroy_buffer(GpuBuffer& buf)
{
    release(device_, buf.buffer, vkDestroyBuffer);
    release(device_, buf.memory, vkFreeMemory);
}

VkShaderModule VulkanRenderer::load_shader(const char* name)
{
    std::vector<char> code = read_binary(std::string(TRI_HARNESS_SHADER_DIR) + "/" + name);

    VkShaderModuleCreateInfo info{};
    info.sType    = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    info.codeSize = code.size();
    info.pCode    = reinterpret_cast<const uint32_t*>(code.data());

    VkShaderModule module = VK_NULL_HANDLE;
    if (vkCreateShaderModule(device_, &info, nullptr, &module) != VK_SUCCESS) {
        throw std::runtime_error(std::string("invalid SPIR-V in ") + name);
    }
    return module;
}

VkSemaphore VulkanRenderer::make_semaphore()
{
    VkSemaphoreCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
    VkSemaphore s = VK_NULL_HANDLE;
    vkCreateSemaphore(device_, &info, nullptr, &s);
    return s;
}

// created signaled so the first wait on a slot returns at once
VkFence VulkanRenderer::make_fence()
{
    VkFenceCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    info.flags = VK_FENCE_CREATE_SIGNALED_BIT;
    VkFence f = VK_NULL_HANDLE;
    vkCreateFence(device_, &info, nullptr, &f);
    return f;
}

// =================== swapchain ===================

bool VulkanRenderer::create_swapchain_objects()
{
    SurfaceSupport support = query_support(gpu_, surface_);
    if (!support.usable()) {
        std::cerr << "[VK] Swapchain support incomplete\n";
        return false;
    }

    const VkSurfaceFormatKHR format = pick_format(support.formats, caps_.prefer_srgb_surface);
    const VkExtent2D extent = pick_extent(support.caps, requested_size_);
    if (extent.width == 0 || extent.height == 0) {
        std::cerr << "[VK] Surface reports a zero extent\n";
        return false;
    }
    // the render pass and pipeline are built once against the first format
    if (render_pass_ != VK_NULL_HANDLE && format.format != color_format_) {
        std::cerr << "[VK] Surface format changed across swapchain rebuild\n";
        return false;
    }

    uint32_t image_count = support.caps.minImageCount + 1;
    if (support.caps.maxImageCount > 0) image_count = std::min(image_count, support.caps.maxImageCount);

    const uint32_t families[] = { graphics_family_, present_family_ };
    const bool shared = graphics_family_ != present_family_;

    VkSwapchainCreateInfoKHR info{};
    info.sType                 = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    info.surface               = surface_;
    info.minImageCount         = image_count;
    info.imageFormat           = format.format;
    info.imageColorSpace       = format.colorSpace;
    info.imageExtent           = extent;
    info.imageArrayLayers      = 1;
    info.imageUsage            = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    info.imageSharingMode      = shared ? VK_SHARING_MODE_CONCURRENT : VK_SHARING_MODE_EXCLUSIVE;
    info.queueFamilyIndexCount = shared ? 2u : 0u;
    info.pQueueFamilyIndices   = shared ? families : nullptr;
    info.preTransform          = support.caps.currentTransform;
    info.compositeAlpha        = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    info.presentMode           = pick_present_mode(support.modes, vsync_);
    info.clipped               = VK_TRUE;

    if (VkResult r = vkCreateSwapchainKHR(device_, &info, nullptr, &swapchain_); r != VK_SUCCESS) {
        std::cerr << "[VK] " << vk_error("vkCreateSwapchainKHR", r) << "\n";
        return false;
    }

    color_format_    = format.format;
    extent_          = extent;
    present_mode_    = info.presentMode;
    min_image_count_ = support.caps.minImageCount;

    vkGetSwapchainImagesKHR(device_, swapchain_, &image_count, nullptr);
    images_.resize(image_count);
    vkGetSwapchainImagesKHR(device_, swapchain_, &image_count, images_.data());

    for (VkImage img : images_) {
        VkImageView view = make_image_view(img, color_format_, VK_IMAGE_ASPECT_COLOR_BIT);
        if (view == VK_NULL_HANDLE) return false;
        image_views_.push_back(view);
    }

    // depth target matching the new extent
    VkImageCreateInfo depth_info{};
    depth_info.sType         = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    depth_info.imageType     = VK_IMAGE_TYPE_2D;
    depth_info.format        = DEPTH_FORMAT;
    depth_info.extent        = {extent_.width, extent_.height, 1};
    depth_info.mipLevels     = 1;
    depth_info.arrayLayers   = 1;
    depth_info.samples       = VK_SAMPLE_COUNT_1_BIT;
    depth_info.tiling        = VK_IMAGE_TILING_OPTIMAL;
    depth_info.usage         = VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT;
    depth_info.sharingMode   = VK_SHARING_MODE_EXCLUSIVE;
    depth_info.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;

    if (vkCreateImage(device_, &depth_info, nullptr, &depth_.image) != VK_SUCCESS) {
        std::cerr << "[VK] Failed to create depth image\n";
        return false;
    }
    VkMemoryRequirements req{};
    vkGetImageMemoryRequirements(device_, depth_.image, &req);
    depth_.memory = allocate_memory(req, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT);
    if (depth_.memory == VK_NULL_HANDLE ||
        vkBindImageMemory(device_, depth_.image, depth_.memory, 0) != VK_SUCCESS) {
        std::cerr << "[VK] Failed to back the depth image with memory\n";
        return false;
    }
    depth_.view = make_image_view(depth_.image, DEPTH_FORMAT, VK_IMAGE_ASPECT_DEPTH_BIT);
    return depth_.view != VK_NULL_HANDLE;
}

bool VulkanRenderer::create_framebuffers()
{
    for (VkImageView color : image_views_) {
        const VkImageView attachments[] = { color, depth_.view };

        VkFramebufferCreateInfo info{};
        info.sType           = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
        info.renderPass      = render_pass_;
        info.attachmentCount = 2;
        info.pAttachments    = attachments;
        info.width           = extent_.width;
        info.height          = extent_.height;
        info.layers          = 1;

        VkFramebuffer fb = VK_NULL_HANDLE;
        if (vkCreateFramebuffer(device_, &info, nullptr, &fb) != VK_SUCCESS) {
            std::cerr << "[VK] Failed to create framebuffer\n";
            return false;
        }
        framebuffers_.push_back(fb);
    }
    return true;
}

void VulkanRenderer::destroy_swapchain_objects()
{
    for (VkFramebuffer& fb : framebuffers_) release(device_, fb, vkDestroyFramebuffer);
    for (VkImageView& view : image_views_) release(device_, view, vkDestroyImageView);
    framebuffers_.clear();
    image_views_.clear();
    images_.clear();

    release(device_, depth_.view, vkDestroyImageView);
    release(device_, depth_.image, vkDestroyImage);
    release(device_, depth_.memory, vkFreeMemory);
    release(device_, swapchain_, vkDestroySwapchainKHR);
}

// =================== pipeline ===================

// One subpass: color cleared and presented, depth cleared and dropped.
bool VulkanRenderer::create_render_pass()
{
    std::array<VkAttachmentDescription, 2> attachments{};
    for (auto& a : attachments) {
        a.samples        = VK_SAMPLE_COUNT_1_BIT;
        a.loadOp         = VK_ATTACHMENT_LOAD_OP_CLEAR;
        a.stencilLoadOp  = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
        a.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
        a.initialLayout  = VK_IMAGE_LAYOUT_UNDEFINED;
    }
    attachments[0].format      = color_format_;
    attachments[0].storeOp     = VK_ATTACHMENT_STORE_OP_STORE;
    attachments[0].finalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;
    attachments[1].format      = DEPTH_FORMAT;
    attachments[1].storeOp     = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    attachments[1].finalLayout = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL;

    const VkAttachmentReference color_ref{0, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL};
    const VkAttachmentReference depth_ref{1, VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL};

    VkSubpassDescription subpass{};
    subpass.pipelineBindPoint       = VK_PIPELINE_BIND_POINT_GRAPHICS;
    subpass.colorAttachmentCount    = 1;
    subpass.pColorAttachments       = &color_ref;
    subpass.pDepthStencilAttachment = &depth_ref;

    // wait for the acquired image before writing color and depth
    const VkPipelineStageFlags stages =
        VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT | VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT;
    VkSubpassDependency dep{};
    dep.srcSubpass    = VK_SUBPASS_EXTERNAL;
    dep.dstSubpass    = 0;
    dep.srcStageMask  = stages;
    dep.dstStageMask  = stages;
    dep.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT | VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;

    VkRenderPassCreateInfo info{};
    info.sType           = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
    info.attachmentCount = static_cast<uint32_t>(attachments.size());
    info.pAttachments    = attachments.data();
    info.subpassCount    = 1;
    info.pSubpasses      = &subpass;
    info.dependencyCount = 1;
    info.pDependencies   = &dep;

    if (vkCreateRenderPass(device_, &info, nullptr, &render_pass_) != VK_SUCCESS) {
        std::cerr << "[VK] Failed to create render pass\n";
        return false;
    }
    return true;
}

// Set layout with the scene UBO at binding 0, then the triangle pipeline.
// Viewport and scissor are dynamic so a resize only rebuilds the swapchain.
bool VulkanRenderer::create_pipeline()
{
    VkDescriptorSetLayoutBinding ubo_binding{};
    ubo_binding.binding         = 0;
    ubo_binding.descriptorType  = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    ubo_binding.descriptorCount = 1;
    ubo_binding.stageFlags      = VK_SHADER_STAGE_VERTEX_BIT;

    VkDescriptorSetLayoutCreateInfo set_info{};
    set_info.sType        = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    set_info.bindingCount = 1;
    set_info.pBindings    = &ubo_binding;

    VkPipelineLayoutCreateInfo layout_info{};
    layout_info.sType          = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    layout_info.setLayoutCount = 1;
    layout_info.pSetLayouts    = &set_layout_;

    if (vkCreateDescriptorSetLayout(device_, &set_info, nullptr, &set_layout_) != VK_SUCCESS ||
        vkCreatePipelineLayout(device_, &layout_info, nullptr, &pipeline_layout_) != VK_SUCCESS) {
        std::cerr << "[VK] Failed to create pipeline layout\n";
        return false;
    }

    std::array<VkShaderModule, 2> modules{};
    modules[0] = load_shader("triangle.vert.spv");
    try {
        modules[1] = load_shader("triangle.frag.spv");
    } catch (const std::runtime_error&) {
        vkDestroyShaderModule(device_, modules[0], nullptr);
        throw;
    }
    std::array<VkPipelineShaderStageCreateInfo, 2> stages{};
    const VkShaderStageFlagBits stage_bits[] = { VK_SHADER_STAGE_VERTEX_BIT, VK_SHADER_STAGE_FRAGMENT_BIT };
    for (size_t i = 0; i < stages.size(); ++i) {
        stages[i].sType  = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        stages[i].stage  = stage_bits[i];
        stages[i].module = modules[i];
        stages[i].pName  = "main";
    }

    const VkVertexInputBindingDescription binding{0, sizeof(Vertex), VK_VERTEX_INPUT_RATE_VERTEX};
    const VkVertexInputAttributeDescription attributes[] = {
        {0, 0, VK_FORMAT_R32G32B32A32_SFLOAT, VERTEX_POSITION_OFFSET},
        {1, 0, VK_FORMAT_R32G32B32A32_SFLOAT, VERTEX_COLOR_OFFSET},
    };

    VkPipelineVertexInputStateCreateInfo vertex_input{};
    vertex_input.sType                           = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
    vertex_input.vertexBindingDescriptionCount   = 1;
    vertex_input.pVertexBindingDescriptions      = &binding;
    vertex_input.vertexAttributeDescriptionCount = 2;
    vertex_input.pVertexAttributeDescriptions    = attributes;

    VkPipelineInputAssemblyStateCreateInfo assembly{};
    assembly.sType    = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
    assembly.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;

    VkPipelineViewportStateCreateInfo viewport{};
    viewport.sType         = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
    viewport.viewportCount = 1;
    viewport.scissorCount  = 1;

    // the triangle spins through both faces, so nothing is culled
    VkPipelineRasterizationStateCreateInfo raster{};
    raster.sType       = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
    raster.polygonMode = VK_POLYGON_MODE_FILL;
    raster.cullMode    = VK_CULL_MODE_NONE;
    raster.frontFace   = VK_FRONT_FACE_CLOCKWISE;
    raster.lineWidth   = 1.0f;

    VkPipelineMultisampleStateCreateInfo msaa{};
    msaa.sType                = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
    msaa.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

    VkPipelineDepthStencilStateCreateInfo depth{};
    depth.sType            = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
    depth.depthTestEnable  = VK_TRUE;
    depth.depthWriteEnable = VK_TRUE;
    depth.depthCompareOp   = VK_COMPARE_OP_LESS;

    VkPipelineColorBlendAttachmentState blend_att{};
    blend_att.blendEnable         = VK_TRUE;
    blend_att.srcColorBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
    blend_att.dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
    blend_att.colorBlendOp        = VK_BLEND_OP_ADD;
    blend_att.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
    blend_att.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
    blend_att.alphaBlendOp        = VK_BLEND_OP_ADD;
    blend_att.colorWriteMask      = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
                                    VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;

    VkPipelineColorBlendStateCreateInfo blend{};
    blend.sType           = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
    blend.attachmentCount = 1;
    blend.pAttachments    = &blend_att;

    const VkDynamicState dynamic_states[] = { VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR };
    VkPipelineDynamicStateCreateInfo dynamic{};
    dynamic.sType             = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
    dynamic.dynamicStateCount = 2;
    dynamic.pDynamicStates    = dynamic_states;

    VkGraphicsPipelineCreateInfo info{};
    info.sType               = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
    info.stageCount          = static_cast<uint32_t>(stages.size());
    info.pStages             = stages.data();
    info.pVertexInputState   = &vertex_input;
    info.pInputAssemblyState = &assembly;
    info.pViewportState      = &viewport;
    info.pRasterizationState = &raster;
    info.pMultisampleState   = &msaa;
    info.pDepthStencilState  = &depth;
    info.pColorBlendState    = &blend;
    info.pDynamicState       = &dynamic;
    info.layout              = pipeline_layout_;
    info.renderPass          = render_pass_;

    VkResult r = vkCreateGraphicsPipelines(device_, VK_NULL_HANDLE, 1, &info, nullptr, &pipeline_);
    for (VkShaderModule m : modules) vkDestroyShaderModule(device_, m, nullptr);

    if (r != VK_SUCCESS) {
        std::cerr << "[VK] " << vk_error("vkCreateGraphicsPipelines", r) << "\n";
        return false;
    }
    return true;
}

// =================== per-frame resources ===================

// Command buffer, sync objects and a persistently mapped UBO with its
// descriptor set, for every frame in flight.
bool VulkanRenderer::create_frame_resources()
{
    VkCommandPoolCreateInfo pool_info{};
    pool_info.sType            = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    pool_info.flags            = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    pool_info.queueFamilyIndex = graphics_family_;
    if (vkCreateCommandPool(device_, &pool_info, nullptr, &command_pool_) != VK_SUCCESS) {
        std::cerr << "[VK] Failed to create command pool\n";
        return false;
    }

    const VkDescriptorPoolSize ubo_size{VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, MAX_FRAMES_IN_FLIGHT};
    VkDescriptorPoolCreateInfo dpool_info{};
    dpool_info.sType         = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    dpool_info.maxSets       = MAX_FRAMES_IN_FLIGHT;
    dpool_info.poolSizeCount = 1;
    dpool_info.pPoolSizes    = &ubo_size;
    if (vkCreateDescriptorPool(device_, &dpool_info, nullptr, &descriptor_pool_) != VK_SUCCESS) {
        std::cerr << "[VK] Failed to create descriptor pool\n";
        return false;
    }

    for (FrameSlot& slot : frames_) {
        VkCommandBufferAllocateInfo cmd_info{};
        cmd_info.sType              = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        cmd_info.commandPool        = command_pool_;
        cmd_info.level              = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        cmd_info.commandBufferCount = 1;

        VkDescriptorSetAllocateInfo set_info{};
        set_info.sType              = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
        set_info.descriptorPool     = descriptor_pool_;
        set_info.descriptorSetCount = 1;
        set_info.pSetLayouts        = &set_layout_;

        slot.image_ready = make_semaphore();
        slot.render_done = make_semaphore();
        slot.in_flight   = make_fence();

        if (vkAllocateCommandBuffers(device_, &cmd_info, &slot.cmd) != VK_SUCCESS ||
            vkAllocateDescriptorSets(device_, &set_info, &slot.descriptor_set) != VK_SUCCESS ||
            !slot.image_ready || !slot.render_done || !slot.in_flight) {
            std::cerr << "[VK] Failed to create frame slot objects\n";
            return false;
        }

        if (!make_host_buffer(sizeof(SceneUbo), VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT, slot.ubo) ||
            vkMapMemory(device_, slot.ubo.memory, 0, sizeof(SceneUbo), 0, &slot.ubo_mapped) != VK_SUCCESS) {
            std::cerr << "[VK] Failed to create uniform buffer\n";
            return false;
        }

        const VkDescriptorBufferInfo ubo_info{slot.ubo.buffer, 0, sizeof(SceneUbo)};
        VkWriteDescriptorSet write{};
        write.sType           = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        write.dstSet          = slot.descriptor_set;
        write.dstBinding      = 0;
        write.descriptorType  = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
        write.descriptorCount = 1;
        write.pBufferInfo     = &ubo_info;
        vkUpdateDescriptorSets(device_, 1, &write, 0, nullptr);
    }
    return true;
}

void VulkanRenderer::destroy_frame_resources()
{
    for (FrameSlot& slot : frames_) {
        if (slot.ubo_mapped) vkUnmapMemory(device_, slot.ubo.memory);
        destroy_buffer(slot.ubo);
        release(device_, slot.image_ready, vkDestroySemaphore);
        release(device_, slot.render_done, vkDestroySemaphore);
        release(device_, slot.in_flight, vkDestroyFence);
        slot = FrameSlot{};
    }
    // the pools free their command buffers and descriptor sets
    release(device_, descriptor_pool_, vkDestroyDescriptorPool);
    release(device_, command_pool_, vkDestroyCommandPool);
}

// A slot whose acquire semaphore or fence was left pending by a failed submit
// gets fresh objects, fence signaled.
bool VulkanRenderer::reset_frame_sync(FrameSlot& slot)
{
    vkDeviceWaitIdle(device_);

    release(device_, slot.image_ready, vkDestroySemaphore);
    release(device_, slot.in_flight, vkDestroyFence);
    slot.image_ready = make_semaphore();
    slot.in_flight   = make_fence();

    if (!slot.image_ready || !slot.in_flight) {
        std::cerr << "[VK] Failed to recreate sync objects for frame " << current_frame_ << "\n";
        return false;
    }
    return true;
}

bool VulkanRenderer::create_triangle_buffers()
{
    auto upload = [this](GpuBuffer& buf, const void* src, VkDeviceSize size, VkBufferUsageFlags usage) {
        void* dst = nullptr;
        if (!make_host_buffer(size, usage, buf) ||
            vkMapMemory(device_, buf.memory, 0, size, 0, &dst) != VK_SUCCESS) {
            return false;
        }
        std::memcpy(dst, src, static_cast<size_t>(size));
        vkUnmapMemory(device_, buf.memory);
        return true;
    };

    if (!upload(vertices_, TRIANGLE_VERTICES, sizeof(TRIANGLE_VERTICES), VK_BUFFER_USAGE_VERTEX_BUFFER_BIT) ||
        !upload(indices_, TRIANGLE_INDICES, sizeof(TRIANGLE_INDICES), VK_BUFFER_USAGE_INDEX_BUFFER_BIT)) {
        std::cerr << "[VK] Failed to create triangle buffers\n";
        return false;
    }
    return true;
}

// =================== surface configuration ===================

bool VulkanRenderer::recreate_surface()
{
    destroy_swapchain_objects();
    if (surface_ != VK_NULL_HANDLE) {
        vkDestroySurfaceKHR(instance_, surface_, nullptr);
        surface_ = VK_NULL_HANDLE;
    }
    if (!create_surface()) return false;

    // the new surface must still be presentable from the queue we picked
    VkBool32 can_present = VK_FALSE;
    vkGetPhysicalDeviceSurfaceSupportKHR(gpu_, present_family_, surface_, &can_present);
    if (!can_present) {
        std::cerr << "[VK] Recreated surface is not presentable\n";
        return false;
    }
    return true;
}

bool VulkanRenderer::rebuild_swapchain()
{
    vkDeviceWaitIdle(device_);

    if (surface_lost_) {
        std::cerr << "[VK] Surface lost, recreating VkSurfaceKHR\n";
        if (!recreate_surface()) return false;
    }

    destroy_swapchain_objects();
    return create_swapchain_objects() && create_framebuffers();
}

Result<Extent2D> VulkanRenderer::configure_surface(Extent2D size)
{
    if (device_ == VK_NULL_HANDLE) {
        return Result<Extent2D>::failure(ErrorKind::SurfaceConfigurationError, "device not created");
    }

    requested_size_ = size;
    try {
        if (!rebuild_swapchain()) {
            return Result<Extent2D>::failure(ErrorKind::SurfaceLost, "swapchain rebuild failed");
        }
    } catch (const std::runtime_error& e) {
        return Result<Extent2D>::failure(ErrorKind::SurfaceLost, e.what());
    }

    if (imgui_initialized_) {
        ImGui_ImplVulkan_SetMinImageCount(std::max(min_image_count_, 2u));
    }
    // the surface may dictate its own extent
    return Result<Extent2D>::success(Extent2D{extent_.width, extent_.height});
}

// =================== per frame ===================

Result<FrameState> VulkanRenderer::acquire_frame()
{
    if (swapchain_ == VK_NULL_HANDLE) {
        return Result<FrameState>::failure(ErrorKind::SurfaceLost, "no swapchain");
    }
    FrameSlot& slot = frames_[current_frame_];

    VkResult waited = vkWaitForFences(device_, 1, &slot.in_flight, VK_TRUE, FRAME_TIMEOUT_NS);
    if (waited == VK_TIMEOUT) {
        return Result<FrameState>::failure(ErrorKind::Timeout, "in-flight fence wait timed out");
    }
    if (waited != VK_SUCCESS) {
        return Result<FrameState>::failure(ErrorKind::ValidationFailed, vk_error("vkWaitForFences", waited));
    }

    FrameState frame;
    VkResult r = vkAcquireNextImageKHR(device_, swapchain_, FRAME_TIMEOUT_NS,
                                       slot.image_ready, VK_NULL_HANDLE, &frame.image_index);
    switch (r) {
    case VK_SUCCESS:
        break;
    case VK_SUBOPTIMAL_KHR:
        frame.surface_outdated = true;
        break;
    case VK_ERROR_OUT_OF_DATE_KHR:
        return Result<FrameState>::failure(ErrorKind::SurfaceLost, "swapchain out of date");
    case VK_ERROR_SURFACE_LOST_KHR:
        surface_lost_ = true;
        return Result<FrameState>::failure(ErrorKind::SurfaceLost, "VkSurfaceKHR lost");
    case VK_TIMEOUT:
    case VK_NOT_READY:
        return Result<FrameState>::failure(ErrorKind::Timeout, "no swapchain image available");
    default:
        return Result<FrameState>::failure(ErrorKind::ValidationFailed, vk_error("vkAcquireNextImageKHR", r));
    }

    // only reset once we know work will be submitted with this fence
    vkResetFences(device_, 1, &slot.in_flight);

    frame.slot = current_frame_;
    frame.size = {extent_.width, extent_.height};
    return Result<FrameState>::success(frame);
}

Status VulkanRenderer::begin_scene_pass(FrameState& frame, const SceneUniforms& uniforms)
{
    FrameSlot& slot = frames_[frame.slot];

    SceneUbo ubo;
    ubo.mvp = scene_mvp(BackendProfile::Native, uniforms);
    std::memcpy(slot.ubo_mapped, &ubo, sizeof(ubo));

    vkResetCommandBuffer(slot.cmd, 0);
    VkCommandBufferBeginInfo begin{};
    begin.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    begin.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    if (vkBeginCommandBuffer(slot.cmd, &begin) != VK_SUCCESS) {
        return Status::failure(ErrorKind::ValidationFailed, "failed to begin recording command buffer");
    }
    slot.recording = true;

    VkClearValue clears[2]{};
    std::copy(clear_color_, clear_color_ + 4, clears[0].color.float32);
    clears[1].depthStencil = {1.0f, 0};

    const VkRect2D area{{0, 0}, extent_};

    VkRenderPassBeginInfo pass{};
    pass.sType           = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    pass.renderPass      = render_pass_;
    pass.framebuffer     = framebuffers_[frame.image_index];
    pass.renderArea      = area;
    pass.clearValueCount = 2;
    pass.pClearValues    = clears;
    vkCmdBeginRenderPass(slot.cmd, &pass, VK_SUBPASS_CONTENTS_INLINE);
    frame.pass_open = true;

    const VkViewport viewport{0.0f, 0.0f,
                              static_cast<float>(extent_.width), static_cast<float>(extent_.height),
                              0.0f, 1.0f};
    vkCmdSetViewport(slot.cmd, 0, 1, &viewport);
    vkCmdSetScissor(slot.cmd, 0, 1, &area);

    const VkDeviceSize offset = 0;
    vkCmdBindPipeline(slot.cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline_);
    vkCmdBindDescriptorSets(slot.cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline_layout_,
                            0, 1, &slot.descriptor_set, 0, nullptr);
    vkCmdBindVertexBuffers(slot.cmd, 0, 1, &vertices_.buffer, &offset);
    vkCmdBindIndexBuffer(slot.cmd, indices_.buffer, 0, VK_INDEX_TYPE_UINT32);
    vkCmdDrawIndexed(slot.cmd, TRIANGLE_INDEX_COUNT, 1, 0, 0, 0);

    return Status::success();
}

Status VulkanRenderer::draw_gui(FrameState& frame, const GuiFrameOutput& gui)
{
    if (!frame.pass_open) {
        return Status::failure(ErrorKind::ValidationFailed, "GUI drawn outside the scene pass");
    }
    if (gui.draw_data) {
        ImGui_ImplVulkan_RenderDrawData(gui.draw_data, frames_[frame.slot].cmd, VK_NULL_HANDLE);
    }
    return Status::success();
}

Status VulkanRenderer::end_scene_pass(FrameState& frame)
{
    FrameSlot& slot = frames_[frame.slot];
    if (frame.pass_open) {
        vkCmdEndRenderPass(slot.cmd);
        frame.pass_open = false;
    }
    if (slot.recording) {
        slot.recording = false;
        if (vkEndCommandBuffer(slot.cmd) != VK_SUCCESS) {
            return Status::failure(ErrorKind::ValidationFailed, "failed to record command buffer");
        }
    }
    return Status::success();
}

// Submits the slot's work, or with no commands only consumes the acquire
// semaphore and signals the fence. A failed submit leaves the slot's sync
// objects pending, so they are replaced.
Status VulkanRenderer::submit_slot(FrameSlot& slot, bool with_commands)
{
    const VkPipelineStageFlags wait_stage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;

    VkSubmitInfo submit{};
    submit.sType              = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submit.waitSemaphoreCount = 1;
    submit.pWaitSemaphores    = &slot.image_ready;
    submit.pWaitDstStageMask  = &wait_stage;
    if (with_commands) {
        submit.commandBufferCount   = 1;
        submit.pCommandBuffers      = &slot.cmd;
        submit.signalSemaphoreCount = 1;
        submit.pSignalSemaphores    = &slot.render_done;
    }

    VkResult r = vkQueueSubmit(graphics_queue_, 1, &submit, slot.in_flight);
    if (r != VK_SUCCESS) {
        std::cerr << "[VK] " << vk_error("vkQueueSubmit", r) << "\n";
        if (!reset_frame_sync(slot)) {
            return Status::failure(ErrorKind::ValidationFailed, "frame sync objects could not be rebuilt");
        }
        return Status::failure(ErrorKind::SurfaceLost, "queue submit failed");
    }
    return Status::success();
}

Status VulkanRenderer::present(FrameState& frame)
{
    FrameSlot& slot = frames_[frame.slot];

    Status submitted = submit_slot(slot, true);
    if (!submitted.ok) {
        // the acquired image was never presented, the caller rebuilds the swapchain
        advance_frame();
        return submitted;
    }

    VkPresentInfoKHR info{};
    info.sType              = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    info.waitSemaphoreCount = 1;
    info.pWaitSemaphores    = &slot.render_done;
    info.swapchainCount     = 1;
    info.pSwapchains        = &swapchain_;
    info.pImageIndices      = &frame.image_index;

    VkResult r = vkQueuePresentKHR(present_queue_, &info);
    advance_frame();

    switch (r) {
    case VK_SUCCESS:
        return Status::success();
    case VK_SUBOPTIMAL_KHR:
        frame.surface_outdated = true;
        return Status::success();
    case VK_ERROR_OUT_OF_DATE_KHR:
        return Status::failure(ErrorKind::SurfaceLost, "swapchain out of date on present");
    case VK_ERROR_SURFACE_LOST_KHR:
        surface_lost_ = true;
        return Status::failure(ErrorKind::SurfaceLost, "VkSurfaceKHR lost on present");
    default:
        return Status::failure(ErrorKind::ValidationFailed, vk_error("vkQueuePresentKHR", r));
    }
}

Status VulkanRenderer::discard_frame(FrameState& frame)
{
    Status ended = end_scene_pass(frame);
    if (!ended.ok) {
        std::cerr << "[VK] " << ended.err.message << " while discarding\n";
    }

    Status submitted = submit_slot(frames_[frame.slot], false);
    advance_frame();
    if (!submitted.ok && submitted.err.kind != ErrorKind::SurfaceLost) {
        return submitted;
    }

    // the image stays acquired until the swapchain is rebuilt
    return Status::failure(ErrorKind::SurfaceLost, "frame discarded");
}

// =================== ImGui ===================

bool VulkanRenderer::init_imgui()
{
    const VkDescriptorPoolSize sampler_size{
        VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, IMGUI_IMPL_VULKAN_MINIMUM_IMAGE_SAMPLER_POOL_SIZE};

    VkDescriptorPoolCreateInfo pool_info{};
    pool_info.sType         = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    pool_info.flags         = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
    pool_info.maxSets       = IMGUI_IMPL_VULKAN_MINIMUM_IMAGE_SAMPLER_POOL_SIZE;
    pool_info.poolSizeCount = 1;
    pool_info.pPoolSizes    = &sampler_size;

    if (vkCreateDescriptorPool(device_, &pool_info, nullptr, &imgui_pool_) != VK_SUCCESS) {
        std::cerr << "[VK] Failed to create ImGui descriptor pool\n";
        return false;
    }

    ImGui_ImplVulkan_InitInfo init_info{};
    init_info.ApiVersion     = VK_API_VERSION_1_1;
    init_info.Instance       = instance_;
    init_info.PhysicalDevice = gpu_;
    init_info.Device         = device_;
    init_info.QueueFamily    = graphics_family_;
    init_info.Queue          = graphics_queue_;
    init_info.DescriptorPool = imgui_pool_;
    init_info.MinImageCount  = std::max(min_image_count_, 2u);
    init_info.ImageCount     = static_cast<uint32_t>(images_.size());

    // main viewport renders inside our scene pass
    init_info.PipelineInfoMain.RenderPass  = render_pass_;
    init_info.PipelineInfoMain.Subpass     = 0;
    init_info.PipelineInfoMain.MSAASamples = VK_SAMPLE_COUNT_1_BIT;
    init_info.CheckVkResultFn = report_imgui_vk_result;

    if (!ImGui_ImplVulkan_Init(&init_info)) {
        return false;
    }
    imgui_initialized_ = true;
    return true;
}

void VulkanRenderer::shutdown_imgui()
{
    if (imgui_initialized_) {
        ImGui_ImplVulkan_Shutdown();
        imgui_initialized_ = false;
    }
    release(device_, imgui_pool_, vkDestroyDescriptorPool);
}

void VulkanRenderer::gui_new_frame()
{
    if (imgui_initialized_) ImGui_ImplVulkan_NewFrame();
}
