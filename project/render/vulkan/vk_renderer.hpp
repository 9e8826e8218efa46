#pragma once
#include <array>
#include <vector>
#include <vulkan/vulkan.h>
#include <cstdint>

#include "../i_render.hpp"

struct GLFWwindow;

// Native backend: Vulkan 1.1 swapchain on a GLFW window, Dear ImGui composited
// through imgui_impl_vulkan in the scene render pass.
class VulkanRenderer : public IRenderBackend {
public:
    VulkanRenderer() = default;
    ~VulkanRenderer() override;

    VulkanRenderer(const VulkanRenderer&) = delete;
    VulkanRenderer& operator=(const VulkanRenderer&) = delete;

    BackendProfile profile() const override { return BackendProfile::Native; }

    Result<SurfaceInfo> initialize(const NativeSurfaceHandle& target,
                                   const SurfaceRequest& request) override;
    Result<Extent2D> configure_surface(Extent2D size) override;
    Result<FrameState> acquire_frame() override;

    Status begin_scene_pass(FrameState& frame, const SceneUniforms& uniforms) override;
    Status draw_gui(FrameState& frame, const GuiFrameOutput& gui) override;
    Status end_scene_pass(FrameState& frame) override;

    Status present(FrameState& frame) override;
    Status discard_frame(FrameState& frame) override;

    void gui_new_frame() override;
    void wait_idle() override;
    void shutdown() override;

private:
    static constexpr int MAX_FRAMES_IN_FLIGHT = 2;

    struct GpuBuffer {
        VkBuffer       buffer{VK_NULL_HANDLE};
        VkDeviceMemory memory{VK_NULL_HANDLE};
    };

    // everything one frame in flight owns
    struct FrameSlot {
        VkCommandBuffer cmd{VK_NULL_HANDLE};
        bool            recording{false};
        VkSemaphore     image_ready{VK_NULL_HANDLE};
        VkSemaphore     render_done{VK_NULL_HANDLE};
        VkFence         in_flight{VK_NULL_HANDLE};
        GpuBuffer       ubo;
        void*           ubo_mapped{nullptr};
        VkDescriptorSet descriptor_set{VK_NULL_HANDLE};
    };

    struct DepthTarget {
        VkImage        image{VK_NULL_HANDLE};
        VkDeviceMemory memory{VK_NULL_HANDLE};
        VkImageView    view{VK_NULL_HANDLE};
    };

    GLFWwindow* window_{nullptr};

    VkInstance       instance_{VK_NULL_HANDLE};
    VkSurfaceKHR     surface_{VK_NULL_HANDLE};
    bool             surface_lost_{false};
    VkPhysicalDevice gpu_{VK_NULL_HANDLE};
    VkDevice         device_{VK_NULL_HANDLE};
    uint32_t         graphics_family_{0};
    uint32_t         present_family_{0};
    VkQueue          graphics_queue_{VK_NULL_HANDLE};
    VkQueue          present_queue_{VK_NULL_HANDLE};

    VkSwapchainKHR             swapchain_{VK_NULL_HANDLE};
    VkFormat                   color_format_{VK_FORMAT_UNDEFINED};
    VkExtent2D                 extent_{};
    VkPresentModeKHR           present_mode_{VK_PRESENT_MODE_FIFO_KHR};
    uint32_t                   min_image_count_{2};
    std::vector<VkImage>       images_;
    std::vector<VkImageView>   image_views_;
    std::vector<VkFramebuffer> framebuffers_;
    DepthTarget                depth_;
    static constexpr VkFormat  DEPTH_FORMAT = VK_FORMAT_D32_SFLOAT;

    VkRenderPass          render_pass_{VK_NULL_HANDLE};
    VkDescriptorSetLayout set_layout_{VK_NULL_HANDLE};
    VkPipelineLayout      pipeline_layout_{VK_NULL_HANDLE};
    VkPipeline            pipeline_{VK_NULL_HANDLE};

    VkCommandPool    command_pool_{VK_NULL_HANDLE};
    VkDescriptorPool descriptor_pool_{VK_NULL_HANDLE};
    std::array<FrameSlot, MAX_FRAMES_IN_FLIGHT> frames_{};
    uint32_t current_frame_{0};

    GpuBuffer vertices_;
    GpuBuffer indices_;

    Extent2D    requested_size_{};
    bool        vsync_{true};
    BackendCaps caps_{};
    float       clear_color_[4]{0.19f, 0.24f, 0.42f, 1.0f};

    VkDescriptorPool imgui_pool_{VK_NULL_HANDLE};
    bool             imgui_initialized_{false};

    // setup, in the order initialize() runs them
    Status create_device();
    bool   create_surface();
    bool   create_swapchain_objects();
    bool   create_render_pass();
    bool   create_framebuffers();
    bool   create_pipeline();
    bool   create_frame_resources();
    bool   create_triangle_buffers();
    bool   init_imgui();

    bool rebuild_swapchain();
    bool recreate_surface();
    bool reset_frame_sync(FrameSlot& slot);

    void destroy_swapchain_objects();
    void destroy_frame_resources();
    void destroy_buffer(GpuBuffer& buf);
    void shutdown_imgui();

    // small builders shared by the setup steps
    VkImageView    make_image_view(VkImage image, VkFormat format, VkImageAspectFlags aspect);
    VkDeviceMemory allocate_memory(const VkMemoryRequirements& req, VkMemoryPropertyFlags props);
    bool           make_host_buffer(VkDeviceSize size, VkBufferUsageFlags usage, GpuBuffer& out);
    VkShaderModule load_shader(const char* name);
    VkSemaphore    make_semaphore();
    VkFence        make_fence();

    Status submit_slot(FrameSlot& slot, bool with_commands);
    void advance_frame() { current_frame_ = (current_frame_ + 1) % MAX_FRAMES_IN_FLIGHT; }
    SurfaceInfo describe_surface() const;
};
